#include "kspacing/csv.hpp"

namespace kspacing {

CSVWriter::CSVWriter(const std::string& filePath) {
    if (filePath == "-") {
        out_ = &std::cout;
        return;
    }
    file_.open(filePath, std::ios::out | std::ios::trunc);
    if (file_) out_ = &file_;
}

CSVWriter::~CSVWriter() { if (out_) out_->flush(); }

void CSVWriter::close() {
    if (!out_) return;
    out_->flush();
    if (file_.is_open()) file_.close();
    out_ = nullptr;
}

std::string CSVWriter::escape_cell(std::string_view s) {
    const bool quote = s.find_first_of(",\"\r\n") != std::string_view::npos ||
                       (!s.empty() && (s.front() == ' ' || s.back() == ' '));
    if (!quote) return std::string(s);
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (char c : s) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

void CSVWriter::write_line(const std::vector<std::string>& cells) {
    if (!out_) return;
    for (std::size_t i = 0; i < cells.size(); ++i) {
        if (i) *out_ << ',';
        *out_ << escape_cell(cells[i]);
    }
    *out_ << '\n';
}

} // namespace kspacing
