#include "persistence/settings_file.h"
#include <cstdio>
#include <fstream>
#include <iterator>

namespace paddleball {

namespace {

size_t find_value(const std::string &raw, const std::string &key) {
    size_t pos = raw.find("\"" + key + "\"");
    if (pos == std::string::npos) return pos;
    pos = raw.find(':', pos);
    if (pos == std::string::npos) return pos;
    pos++;
    while (pos < raw.size() && (raw[pos]==' '||raw[pos]=='\t'||raw[pos]=='\n'||raw[pos]=='\r')) pos++;
    return pos;
}

// looks for "key" then ':' then an optionally negative integer
void extract_int(const std::string &raw, const std::string &key, int &dst) {
    size_t pos = find_value(raw, key);
    if (pos == std::string::npos) return;
    bool neg=false; if (pos<raw.size() && raw[pos]=='-'){ neg=true; pos++; }
    long val=0; bool any=false;
    while (pos < raw.size() && raw[pos]>='0' && raw[pos]<='9') {
        any=true; val = val*10 + (raw[pos]-'0'); pos++;
        if (val > 1000000000L) return;
    }
    if (!any) return;
    if (neg) val = -val;
    dst = (int)val;
}

void extract_string(const std::string &raw, const std::string &key, std::string &dst) {
    size_t pos = find_value(raw, key);
    if (pos == std::string::npos || pos >= raw.size() || raw[pos] != '"') return;
    pos++;
    std::string out;
    while (pos < raw.size() && raw[pos] != '"') {
        char c = raw[pos++];
        if (c == '\\' && pos < raw.size()) {
            char e = raw[pos++];
            if (e == 'n') out.push_back('\n');
            else if (e == 't') out.push_back('\t');
            else out.push_back(e);
            continue;
        }
        out.push_back(c);
    }
    if (pos >= raw.size()) return; // unterminated
    dst = out;
}

void extract_color(const std::string &raw, const std::string &key, unsigned int &dst) {
    std::string text;
    extract_string(raw, key, text);
    unsigned int c = 0;
    if (!text.empty() && parse_hex_color(text, c)) dst = c;
}

std::string quoted(const std::string &s) {
    std::string out = "\"";
    for (char c : s) {
        if (c == '"' || c == '\\') { out.push_back('\\'); out.push_back(c); }
        else if (c == '\n') out += "\\n";
        else if (c == '\t') out += "\\t";
        else out.push_back(c);
    }
    out.push_back('"');
    return out;
}

} // namespace

bool parse_hex_color(const std::string &text, unsigned int &out) {
    size_t start = (!text.empty() && text[0] == '#') ? 1 : 0;
    if (text.size() - start != 6) return false;
    unsigned int v = 0;
    for (size_t i = start; i < text.size(); ++i) {
        char c = text[i];
        unsigned int d;
        if (c >= '0' && c <= '9') d = c - '0';
        else if (c >= 'a' && c <= 'f') d = 10 + (c - 'a');
        else if (c >= 'A' && c <= 'F') d = 10 + (c - 'A');
        else return false;
        v = (v << 4) | d;
    }
    out = v;
    return true;
}

std::string format_hex_color(unsigned int color) {
    char buf[8];
    std::snprintf(buf, sizeof buf, "#%06x", color & 0xffffffu);
    return buf;
}

Settings SettingsManager::parse(const std::string &raw) const {
    Settings s; // defaults

    extract_string(raw, "name", s.name);
    extract_string(raw, "start_text", s.start_text);
    extract_string(raw, "player1_win_text", s.player1_win_text);
    extract_string(raw, "player2_win_text", s.player2_win_text);
    extract_string(raw, "instructions_desktop", s.instructions_desktop);
    extract_string(raw, "instructions_mobile", s.instructions_mobile);
    extract_string(raw, "font_family", s.font_family);

    extract_color(raw, "background_color", s.background_color);
    extract_color(raw, "text_color", s.text_color);
    extract_color(raw, "primary_color", s.primary_color);
    extract_color(raw, "left_paddle_color", s.left_paddle_color);
    extract_color(raw, "right_paddle_color", s.right_paddle_color);
    extract_color(raw, "ball_color", s.ball_color);

    extract_int(raw, "paddle_width", s.paddle_width);
    extract_int(raw, "paddle_height", s.paddle_height);
    extract_int(raw, "paddle_speed", s.paddle_speed);
    extract_int(raw, "ball_speed", s.ball_speed);
    extract_int(raw, "ball_size", s.ball_size);
    extract_int(raw, "win_score", s.win_score);
    extract_int(raw, "difficulty", s.difficulty);
    extract_int(raw, "ball_direction_y", s.ball_direction_y);

    validate_settings(s);
    return s;
}

Settings SettingsManager::load(const std::string &path) const {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        Settings s;
        validate_settings(s);
        return s;
    }
    std::string raw((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    return parse(raw);
}

bool SettingsManager::save(const std::string &path, const Settings &s) const {
    std::ofstream ofs(path, std::ios::trunc | std::ios::binary);
    if (!ofs) return false;
    ofs << "{\n";
    ofs << "  \"name\": " << quoted(s.name) << ",\n";
    ofs << "  \"start_text\": " << quoted(s.start_text) << ",\n";
    ofs << "  \"player1_win_text\": " << quoted(s.player1_win_text) << ",\n";
    ofs << "  \"player2_win_text\": " << quoted(s.player2_win_text) << ",\n";
    ofs << "  \"instructions_desktop\": " << quoted(s.instructions_desktop) << ",\n";
    ofs << "  \"instructions_mobile\": " << quoted(s.instructions_mobile) << ",\n";
    ofs << "  \"font_family\": " << quoted(s.font_family) << ",\n";

    ofs << "  \"background_color\": " << quoted(format_hex_color(s.background_color)) << ",\n";
    ofs << "  \"text_color\": " << quoted(format_hex_color(s.text_color)) << ",\n";
    ofs << "  \"primary_color\": " << quoted(format_hex_color(s.primary_color)) << ",\n";
    ofs << "  \"left_paddle_color\": " << quoted(format_hex_color(s.left_paddle_color)) << ",\n";
    ofs << "  \"right_paddle_color\": " << quoted(format_hex_color(s.right_paddle_color)) << ",\n";
    ofs << "  \"ball_color\": " << quoted(format_hex_color(s.ball_color)) << ",\n";

    ofs << "  \"paddle_width\": " << s.paddle_width << ",\n";
    ofs << "  \"paddle_height\": " << s.paddle_height << ",\n";
    ofs << "  \"paddle_speed\": " << s.paddle_speed << ",\n";
    ofs << "  \"ball_speed\": " << s.ball_speed << ",\n";
    ofs << "  \"ball_size\": " << s.ball_size << ",\n";
    ofs << "  \"win_score\": " << s.win_score << ",\n";
    ofs << "  \"difficulty\": " << s.difficulty << ",\n";
    ofs << "  \"ball_direction_y\": " << s.ball_direction_y << "\n";
    ofs << "}\n";
    return static_cast<bool>(ofs);
}

} // namespace paddleball
