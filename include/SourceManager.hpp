#pragma once
#include <sstream>
#include <string>
#include <vector>

// Keeps the source text of one script so diagnostics can quote the
// offending line with a caret under the reported column.
class SourceManager {
   public:
    std::string filename;
    std::string source;

    SourceManager(const std::string& fname, const std::string& src)
        : filename(fname), source(src) {
        split_lines();
    }

    std::string get_line(int line_num) const {
        if (line_num < 1 || static_cast<size_t>(line_num) > lines.size()) return "";
        return lines[static_cast<size_t>(line_num) - 1];
    }

    std::string format_error_context(int line, int col, int length = 1) const {
        std::string prefix = " * " + std::to_string(line) + " | ";
        std::string line_text = get_line(line);

        std::ostringstream ss;
        ss << prefix << line_text << "\n";
        ss << std::string(prefix.size() + static_cast<size_t>(col > 0 ? col - 1 : 0), ' ');
        ss << std::string(static_cast<size_t>(length > 1 ? length : 1), '^');
        return ss.str();
    }

   private:
    std::vector<std::string> lines;

    void split_lines() {
        std::string current_line;
        for (char c : source) {
            if (c == '\n') {
                lines.push_back(current_line);
                current_line.clear();
            } else if (c != '\r') {
                current_line += c;
            }
        }
        if (!current_line.empty()) {
            lines.push_back(current_line);
        }
    }
};
