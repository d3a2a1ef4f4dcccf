#pragma once

#include <fstream>
#include <initializer_list>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace kspacing {

// CSV writer for result tables. A path of "-" writes to std::cout.
class CSVWriter {
public:
    explicit CSVWriter(const std::string& filePath);
    ~CSVWriter();

    CSVWriter(const CSVWriter&) = delete;
    CSVWriter& operator=(const CSVWriter&) = delete;

    bool is_open() const { return out_ != nullptr && static_cast<bool>(*out_); }
    void close();

    void header(const std::vector<std::string>& cols) { write_line(cols); }
    void header(std::initializer_list<std::string> cols) { write_line(std::vector<std::string>(cols)); }

    // One row; each value is formatted with operator<< unless already a string.
    template <typename... Ts>
    void row(const Ts&... values) {
        std::vector<std::string> cells;
        cells.reserve(sizeof...(Ts));
        (cells.emplace_back(cell(values)), ...);
        write_line(cells);
    }

private:
    std::ofstream file_{};
    std::ostream* out_ = nullptr;

    void write_line(const std::vector<std::string>& cells);
    static std::string escape_cell(std::string_view s);

    template <typename T>
    static std::string cell(const T& v) {
        if constexpr (std::is_convertible_v<const T&, std::string_view>) {
            return std::string(std::string_view(v));
        } else {
            std::ostringstream oss;
            oss << v;
            return std::move(oss).str();
        }
    }
};

} // namespace kspacing
