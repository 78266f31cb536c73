#include "ui/Formatting.hpp"
#include "ui/Terminal.hpp"
#include <algorithm>
#include <cstdio>

namespace seagreen::ui {

int u8_len(unsigned char c){
  if (c < 0x80) return 1;
  if ((c >> 5) == 0x6) return 2;
  if ((c >> 4) == 0xE) return 3;
  if ((c >> 3) == 0x1E) return 4;
  return 1;
}

// Length of the ANSI CSI sequence at i, or 0 when there is none there
static size_t csi_len(const std::string& s, size_t i) {
  if (s[i] != '\x1B' || i + 1 >= s.size() || s[i+1] != '[') return 0;
  size_t j = i + 2;
  while (j < s.size() && (s[j] < '@' || s[j] > '~')) ++j;
  return (j < s.size() ? j + 1 : j) - i;
}

// Each glyph counts as one column; escape sequences count as none
int display_cols(const std::string& s){
  int cols = 0;
  size_t i = 0;
  while (i < s.size()) {
    if (size_t esc = csi_len(s, i)) { i += esc; continue; }
    i += static_cast<size_t>(u8_len(static_cast<unsigned char>(s[i])));
    ++cols;
  }
  return cols;
}

std::string take_cols(const std::string& s, int cols){
  std::string out;
  if (cols <= 0) return out;
  size_t i = 0;
  for (int seen = 0; i < s.size() && seen < cols; ) {
    if (size_t esc = csi_len(s, i)) { i += esc; continue; }
    size_t len = static_cast<size_t>(u8_len(static_cast<unsigned char>(s[i])));
    i = std::min(s.size(), i + len);
    ++seen;
  }
  out.assign(s, 0, i);
  return out;
}

std::string trunc_pad(const std::string& s, int w) {
  if (w <= 0) return "";
  int cols = display_cols(s);
  if (cols == w) return s;
  if (cols < w) return s + std::string(w - cols, ' ');
  if (w <= 1) return take_cols(s, w);
  return take_cols(s, w - 1) + (use_unicode()? "…" : ".");
}

std::string lr_align(int iw, const std::string& left, const std::string& right){
  if (iw <= 0) return std::string();
  int rvis = display_cols(right);
  int tlw = iw - rvis - 1;
  if (tlw < 0) tlw = 0;
  std::string l = trunc_pad(left, tlw);
  int lvis = display_cols(l);
  int space = iw - lvis - rvis;
  if (space < 0) space = 0;
  return l + std::string(space, ' ') + right;
}

std::string center(const std::string& s, int w) {
  int cols = display_cols(s);
  if (cols >= w) return s;
  return std::string((w - cols) / 2, ' ') + s;
}

std::string format_fixed(double v, int precision) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", std::clamp(precision, 0, 6), v);
  return buf;
}

std::string format_mib(double bytes) {
  if (bytes < 0.0) bytes = 0.0;
  return format_fixed(bytes / (1024.0 * 1024.0), 1) + " MB";
}

} // namespace seagreen::ui
