#pragma once

#include <cstdint>
#include <string>

namespace seagreen::ui {

// UTF-8 text width utilities
int u8_len(unsigned char c);
int display_cols(const std::string& s);
std::string take_cols(const std::string& s, int cols);

// Text formatting and alignment
std::string trunc_pad(const std::string& s, int w);
std::string lr_align(int iw, const std::string& left, const std::string& right);
std::string center(const std::string& s, int w);

// 12.3 MB style, base 1024
std::string format_mib(double bytes);
std::string format_fixed(double v, int precision);

} // namespace seagreen::ui
