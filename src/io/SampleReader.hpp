#pragma once
#include <istream>
#include <stdexcept>
#include <string>
#include <vector>

// line-oriented sample source, one sample per line
//  - field 0 returns the whole line
//  - field N (1-based) returns the N-th field
//  - delimiter '\0' splits on runs of whitespace like awk does, leading whitespace ignored
//    any other delimiter splits on every occurrence, so empty fields are possible
class SampleReader {
    public:
    explicit SampleReader(std::istream& in, size_t field = 0, char delimiter = '\0')
        : m_in(in), m_field(field), m_delimiter(delimiter) {}

    class FieldError : public std::runtime_error {
        public:
        explicit FieldError(const std::string& msg) : std::runtime_error(msg) {}
    };

    // false at end of input, throws FieldError if the selected field is missing or empty
    bool next(std::string& sample);

    // pure helpers, also used by tests
    static std::vector<std::string> split_fields(const std::string& line, char delimiter);
    static std::string select_field(const std::string& line, size_t field, char delimiter);

    size_t lines_read() const { return m_lines; }

    private:
    std::istream& m_in;
    size_t m_field;
    char m_delimiter;
    size_t m_lines = 0;
};
