#include "editor.hpp"
#include <ncurses.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <string>
#include <filesystem>
#include "file_reader.hpp"

static constexpr int ESC = 27;

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return (j > i) ? s.substr(i, j - i) : std::string();
}

// Number of UTF-8 code points, continuation bytes skipped.
static size_t glyph_count(const std::string& s) {
  return static_cast<size_t>(std::count_if(s.begin(), s.end(), [](char c){ return (static_cast<unsigned char>(c) & 0xC0) != 0x80; }));
}

void Editor::register_commands() {
  registry.register_command("q", [this](const std::vector<std::string>&){ quit_requested = true; });
  registry.register_command("quit", [this](const std::vector<std::string>&){ quit_requested = true; });
  registry.register_command("q!", [this](const std::vector<std::string>&){ quit_requested = true; });
  registry.register_command("set indent", [this](const std::vector<std::string>& args){
    if (args.empty()) { message = "indent=" + std::to_string(indent_width); return; }
    const std::string& s = args[0];
    bool ok = !s.empty() && s.size() < 4 && std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
    if (!ok) { message = "set indent: width must be a number"; return; }
    int w = std::stoi(s);
    if (w < 1 || w > BV_MAX_INDENT_WIDTH) { message = "set indent: width must be 1.." + std::to_string(BV_MAX_INDENT_WIDTH); return; }
    indent_width = w;
    message = "indent=" + std::to_string(w);
  });
  registry.register_command("set bullet", [this](const std::vector<std::string>& args){
    if (args.empty()) { message = "set bullet: use :set bullet <glyph>"; return; }
    if (glyph_count(args[0]) != 1) { message = "set bullet: glyph must be a single character"; return; }
    bullet_glyph = args[0];
    message = "bullet=" + bullet_glyph;
  });
  registry.register_command("set status", [this](const std::vector<std::string>& args){
    if (args.empty()) { show_status = !show_status; }
    else if (args[0] == "on") { show_status = true; }
    else if (args[0] == "off") { show_status = false; }
    else { message = "set status: use :set status on|off"; return; }
    message = show_status ? "status on" : "status off";
  });
  registry.register_command("tree", [this](const std::vector<std::string>&){
    int id = tree.active_id();
    std::string path;
    for (auto p = tree.parent_of(id); p && *p != tree.root_id(); p = tree.parent_of(*p)) path = std::to_string(*p) + "/" + path;
    message = "bullet " + path + std::to_string(id) + " depth " + std::to_string(tree.depth_of(id)) +
              " of " + std::to_string(tree.node_count() - 1) + " bullets";
  });
}

void Editor::handle_command_input(int ch) {
  if (ch == ESC || ch == 3) { mode = Mode::Normal; cmdline.clear(); return; }
  if (ch == '\n' || ch == KEY_ENTER || ch == '\r') {
    mode = Mode::Normal;
    std::string line = cmdline;
    cmdline.clear();
    execute_command(line);
    return;
  }
  if (ch == KEY_BACKSPACE || ch == 127 || ch == 8) {
    if (cmdline.empty()) { mode = Mode::Normal; return; }
    cmdline.pop_back();
    return;
  }
  if (ch >= 32 && ch < 127) cmdline.push_back(static_cast<char>(ch));
}

void Editor::execute_command(const std::string& line) {
  std::string s = trim(line);
  if (!s.empty() && s[0] == ':') s.erase(s.begin());
  std::istringstream iss(s);
  std::string cmd; iss >> cmd;
  if (cmd.empty()) return;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  if (cmd == "set" && !args.empty()) {
    std::string name = args[0];
    std::string value;
    size_t eq = name.find('=');
    if (eq != std::string::npos) {
      value = name.substr(eq + 1);
      name = name.substr(0, eq);
    }
    std::string composite = "set " + name;
    std::vector<std::string> subargs;
    if (!value.empty()) subargs.push_back(value);
    for (size_t i = 1; i < args.size(); ++i) subargs.push_back(args[i]);
    if (!registry.execute(composite, subargs)) { message = "unknown command: " + composite; }
    return;
  }
  if (!registry.execute(cmd, args)) { message = "unknown command: " + cmd; }
}

std::optional<std::filesystem::path> Editor::default_rc_path() {
  const char* home = std::getenv("HOME");
  if (!home) return std::nullopt;
  return std::filesystem::path(home) / BV_RC_NAME;
}

void Editor::load_rc(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return;
  std::vector<std::string> lines; std::string msg;
  if (!mmap_read_lines(path, lines, msg)) { message = msg; render(); return; }
  for (const std::string& raw : lines) {
    std::string s = trim(raw);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s.size() >= 2 && s[0] == '/' && s[1] == '/') continue;
    execute_command(s);
  }
  render();
}
