#include "litdiff/binary.hpp"

#include <iostream>
#include <string>

static bool expect_eq(const std::string& got, const std::string& want, const char* what) {
  if (got == want)
    return true;
  std::cerr << what << ": got [" << got << "] want [" << want << "]\n";
  return false;
}

int main() {
  using namespace litdiff::binary;

  if (!expect_eq(normalize("<<116,105,116,108,101>>"), "\"title\"", "printable bytes"))
    return 1;
  if (!expect_eq(normalize("%{title => <<116, 105,116,108,101>>}"), "%{title => \"title\"}",
                 "bytes inside a map"))
    return 1;

  // non-printable bytes stay, only the commas get spaced
  if (!expect_eq(stringify_printable("<<0,255,5>>"), "<<0,255,5>>", "non-printable untouched"))
    return 1;
  if (!expect_eq(normalize("<<0,255,5>>"), "<<0, 255, 5>>", "non-printable spaced"))
    return 1;
  if (!expect_eq(normalize("<<256,1>>"), "<<256, 1>>", "out of range byte"))
    return 1;
  if (!expect_eq(normalize("<<0065,066>>"), "\"AB\"", "zero-padded bytes"))
    return 1;
  if (!expect_eq(normalize("<<0000256>>"), "<<0000256>>", "zero-padded byte out of range"))
    return 1;
  if (!expect_eq(normalize("<<195,169>>"), "\"\xc3\xa9\"", "multi-byte text"))
    return 1;
  if (!expect_eq(normalize("<<104,105,10>>"), "\"hi\\n\"", "escaped newline"))
    return 1;
  if (!expect_eq(normalize("<<35,123,120,125>>"), "\"\\#{x}\"", "interpolation marker"))
    return 1;

  if (!expect_eq(stringify_bit_specs("<<_ :: 32>>"), "\"<<_ :: 32>>\"", "bit spec"))
    return 1;
  if (!expect_eq(stringify_bit_specs("<<_ :: _ * 8>>"), "\"<<_ :: _ * 8>>\"", "unit spec"))
    return 1;
  if (!expect_eq(stringify_bit_specs("\"<<_ :: 32>>\""), "\"<<_ :: 32>>\"", "already quoted"))
    return 1;
  if (!expect_eq(normalize("%{:count => <<_ :: 32>>}"), "%{:count => \"<<_ :: 32>>\"}",
                 "bit spec in a map"))
    return 1;

  if (!expect_eq(space_commas("<<1,2,3>> and a,b"), "<<1, 2, 3>> and a,b", "space_commas scope"))
    return 1;
  if (!expect_eq(quote("a\"b\\c\x1b"), "\"a\\\"b\\\\c\\e\"", "quote escapes"))
    return 1;

  std::cout << "binary OK\n";
  return 0;
}
