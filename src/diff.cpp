#include "litdiff/diff.hpp"

#include <utility>

namespace litdiff::diff {

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> out;
  while (!text.empty()) {
    const std::size_t nl = text.find('\n');
    std::string line(text.substr(0, nl));
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    out.push_back(std::move(line));
    if (nl == std::string_view::npos)
      break;
    text.remove_prefix(nl + 1);
  }
  return out;
}

namespace {

// Furthest x reached on each diagonal k of one layer d, stored at k + d.
using Frontier = std::vector<int>;

// Walk the saved layers back from (n, m) and emit the script in order.
std::vector<Op> backtrack(const std::vector<Frontier> &layers, int n, int m) {
  std::vector<Op> rev;
  int x = n;
  int y = m;
  for (int d = static_cast<int>(layers.size()) - 1; d > 0; --d) {
    const Frontier &prev = layers[d - 1];
    const auto reach = [&](int k) { return prev[k + d - 1]; };
    const int k = x - y;
    const bool down = k == -d || (k != d && reach(k - 1) < reach(k + 1));
    const int prev_k = down ? k + 1 : k - 1;
    const int prev_x = reach(prev_k);
    const int prev_y = prev_x - prev_k;
    // snake back to the point right after this edit
    const int edge_x = down ? prev_x : prev_x + 1;
    for (; x > edge_x; --x, --y)
      rev.push_back(Op::Keep);
    rev.push_back(down ? Op::Insert : Op::Delete);
    x = prev_x;
    y = prev_y;
  }
  for (; x > 0 && y > 0; --x, --y)
    rev.push_back(Op::Keep);
  return {rev.rbegin(), rev.rend()};
}

} // namespace

std::vector<Op> edit_script(const std::vector<std::string> &a,
                            const std::vector<std::string> &b) {
  const int n = static_cast<int>(a.size());
  const int m = static_cast<int>(b.size());
  const int max_d = n + m;
  if (max_d == 0)
    return {};

  // working frontier over every diagonal; each layer keeps only its 2d+1 window
  std::vector<int> v(2 * max_d + 2, 0);
  std::vector<Frontier> layers;

  for (int d = 0; d <= max_d; ++d) {
    bool done = false;
    for (int k = -d; k <= d && !done; k += 2) {
      const bool down = k == -d || (k != d && v[max_d + k - 1] < v[max_d + k + 1]);
      int x = down ? v[max_d + k + 1] : v[max_d + k - 1] + 1;
      int y = x - k;
      while (x < n && y < m && a[x] == b[y]) {
        ++x;
        ++y;
      }
      v[max_d + k] = x;
      done = x >= n && y >= m;
    }
    layers.emplace_back(v.begin() + (max_d - d), v.begin() + (max_d + d + 1));
    if (done)
      return backtrack(layers, n, m);
  }
  return {};
}

std::vector<ChangeRun> change_runs(const std::vector<std::string> &a,
                                   const std::vector<std::string> &b) {
  std::vector<ChangeRun> runs;
  ChangeRun cur;
  const auto flush = [&] {
    if (!cur.deleted.empty() || !cur.inserted.empty())
      runs.push_back(std::exchange(cur, ChangeRun{}));
  };

  std::size_t ia = 0;
  std::size_t ib = 0;
  for (const Op op : edit_script(a, b)) {
    switch (op) {
    case Op::Keep:
      flush();
      ++ia;
      ++ib;
      break;
    case Op::Delete:
      cur.deleted.push_back(a[ia++]);
      break;
    case Op::Insert:
      cur.inserted.push_back(b[ib++]);
      break;
    }
  }
  flush();
  return runs;
}

} // namespace litdiff::diff
