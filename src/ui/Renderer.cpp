#include "ui/Renderer.hpp"
#include "ui/Formatting.hpp"
#include "ui/Terminal.hpp"
#include "util/Retro.hpp"
#include <algorithm>

using seagreen::model::ReplyKind;

namespace seagreen::ui {

static std::string repeat_str(const std::string& ch, int n){
  std::string r;
  r.reserve(std::max(0,n* (int)ch.size()));
  for (int i=0;i<n;i++) r += ch;
  return r;
}

std::vector<std::string> make_box(const std::string& title, const std::vector<std::string>& lines, int width) {
  int iw = std::max(3, width - 2);
  std::vector<std::string> out;
  const bool uni = use_unicode();
  const std::string TL = uni? "╭" : "+";
  const std::string TR = uni? "╮" : "+";
  const std::string BL = uni? "╰" : "+";
  const std::string BR = uni? "╯" : "+";
  const std::string H  = uni? "─" : "-";
  const std::string V  = uni? "│" : "|";
  auto top = [&]{
    std::string t = "[ " + title + " ]";
    int fill = std::max(0, iw - display_cols(t));
    int left = fill / 2; int right = fill - left;
    return TL + repeat_str(H, left) + t + repeat_str(H, right) + TR;
  }();
  out.push_back(top);
  for (const auto& ln : lines) out.push_back(V + trunc_pad(ln, iw) + V);
  out.push_back(BL + repeat_str(H, iw) + BR);
  return out;
}

std::vector<std::string> report_lines(const seagreen::model::Report& r, int width) {
  const int iw = std::max(3, width - 2);
  auto row = [&](const std::string& k, const std::string& v){ return lr_align(iw, " " + k, v + " "); };
  std::vector<std::string> body;
  body.push_back(row("Process", r.process_name.empty() ? std::to_string(r.pid) : r.process_name));
  body.push_back(row("PID", std::to_string(r.pid)));
  body.push_back(row("Duration", format_fixed(r.duration_s, 1) + "s"));
  body.push_back(row("Samples", std::to_string(r.samples)));
  body.push_back(row("Avg CPU", format_fixed(r.avg_cpu_pct, 1) + "%"));
  body.push_back(row("Peak CPU", format_fixed(r.peak_cpu_pct, 1) + "%"));
  body.push_back(row("Avg Memory", format_mib(r.avg_memory_bytes)));
  body.push_back(row("Peak Memory", format_mib(static_cast<double>(r.peak_memory_bytes))));
  body.push_back(row("CPU-Seconds", format_fixed(r.cpu_seconds, 2)));
  body.push_back(std::string());
  const bool uni = use_unicode();
  auto bar = seagreen::util::retro_bar(r.score.value, 20, uni ? "█" : "#", uni ? "░" : ".");
  body.push_back(row("Efficiency", bar + " " + std::to_string(r.score.value) + "/100"));
  body.push_back(row("Rating", seagreen::model::to_string(r.score.tier)));
  if (r.end_reason == seagreen::model::EndReason::ProcessGone) {
    body.push_back(" Process exited after " + format_fixed(r.duration_s, 1) + "s of " +
                   std::to_string(r.requested_seconds) + "s");
  }
  if (r.score.insufficient_data) {
    body.push_back(" Insufficient data: no CPU interval was observed");
  }
  return make_box("EFFICIENCY REPORT", body, width);
}

TextRenderer::TextRenderer(std::ostream& out, const Config::Colors& colors, bool color, bool live_progress)
  : out_(out), live_progress_(live_progress) {
  if (!color) return;
  pal_.primary   = sgr_hex(colors.primary, 2);
  pal_.secondary = sgr_hex(colors.secondary, 2);
  pal_.accent    = sgr_hex(colors.accent, 10);
  pal_.leaf      = sgr_hex(colors.leaf, 10);
  pal_.ocean     = sgr_hex(colors.ocean, 6);
  pal_.error     = sgr_hex(colors.error, 1);
  pal_.bold      = sgr_bold();
  pal_.dim       = sgr_dim();
  pal_.reset     = sgr_reset();
}

std::string TextRenderer::paint(const std::string& sgr, const std::string& text) const {
  if (sgr.empty()) return text;
  return sgr + text + pal_.reset;
}

void TextRenderer::end_progress_line() {
  if (!progress_open_) return;
  out_ << "\n";
  progress_open_ = false;
}

void TextRenderer::banner() {
  const int w = std::min(72, term_cols());
  out_ << "\n";
  out_ << paint(pal_.bold + pal_.primary, center("S E A G R E E N", w)) << "\n";
  out_ << paint(pal_.leaf, center("Process Efficiency Monitor", w)) << "\n\n";
  out_ << paint(pal_.dim + pal_.ocean, center("Type /help for commands", w)) << "\n\n";
  out_.flush();
}

void TextRenderer::prompt() {
  out_ << paint(pal_.bold + pal_.primary, "seagreen > ");
  out_.flush();
}

void TextRenderer::session_started(const seagreen::model::ProcessHandle& handle, int seconds) {
  out_ << "\n" << paint(pal_.bold + pal_.primary,
                        "Monitoring PID " + std::to_string(handle.pid) + " (" + handle.name + ") for " +
                        std::to_string(seconds) + "s...") << "\n";
  out_ << paint(pal_.dim, "Press Ctrl+C to stop early") << "\n";
  out_.flush();
}

void TextRenderer::session_tick(const seagreen::model::Progress& progress) {
  if (!live_progress_) return;
  out_ << "\r" << paint(pal_.ocean, "Tracking... " + format_fixed(progress.elapsed_s, 1) + "s / " +
                                    std::to_string(progress.requested_seconds) + "s elapsed") << "   ";
  out_.flush();
  progress_open_ = true;
}

void TextRenderer::help() {
  out_ << "\n" << paint(pal_.bold + pal_.primary, "Seagreen Commands:") << "\n\n";
  out_ << "  /list               Show processes you can track\n";
  out_ << "  /track <pid> [time] Monitor a process (default 10s)\n";
  out_ << "  /help               Show this help message\n";
  out_ << "  /quit               Exit Seagreen\n\n";
  out_ << paint(pal_.bold + pal_.secondary, "Examples:") << "\n";
  out_ << "  /list               See what's running\n";
  out_ << "  /track 1234         Monitor PID 1234 for 10 seconds\n";
  out_ << "  /track 1234 30      Monitor PID 1234 for 30 seconds\n\n";
}

void TextRenderer::process_list(const std::vector<seagreen::model::ProcessEntry>& procs) {
  const int cmd_w = 60;
  out_ << "\n  " << paint(pal_.bold, trunc_pad("PID", 8) + trunc_pad("Process", 16) + "Command") << "\n";
  for (const auto& p : procs) {
    out_ << "  " << paint(pal_.bold + pal_.primary, trunc_pad(std::to_string(p.pid), 8))
         << trunc_pad(p.name, 16)
         << paint(pal_.secondary, display_cols(p.cmd) > cmd_w ? take_cols(p.cmd, cmd_w - 3) + "..." : p.cmd)
         << "\n";
  }
  out_ << "\n" << paint(pal_.dim, "Use: /track <pid> to monitor one") << "\n\n";
}

void TextRenderer::report(const seagreen::model::Report& r) {
  out_ << "\n";
  for (const auto& ln : report_lines(r, std::min(56, term_cols()))) {
    out_ << paint(pal_.accent, ln) << "\n";
  }
  out_ << "\n";
}

void TextRenderer::error(const seagreen::model::Reply& reply) {
  // An interrupted session is not the user's mistake
  const auto& color = reply.error == seagreen::model::ErrorKind::Cancelled ? pal_.secondary : pal_.error;
  out_ << paint(pal_.bold + color, reply.message) << "\n";
}

void TextRenderer::reply(const seagreen::model::Reply& reply) {
  end_progress_line();
  switch (reply.kind) {
    case ReplyKind::None:   break;
    case ReplyKind::Help:   help(); break;
    case ReplyKind::List:
      if (reply.processes.empty()) out_ << paint(pal_.bold + pal_.secondary, reply.message) << "\n";
      else process_list(reply.processes);
      break;
    case ReplyKind::Report: if (reply.report) report(*reply.report); break;
    case ReplyKind::Error:  error(reply); break;
    case ReplyKind::Quit:   out_ << paint(pal_.bold + pal_.leaf, reply.message) << "\n"; break;
  }
  out_.flush();
}

} // namespace seagreen::ui
