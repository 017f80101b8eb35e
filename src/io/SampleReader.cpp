/**
 * @file SampleReader.cpp
 * @brief Reading samples from a text stream with optional column selection.
 */

#include "SampleReader.hpp"
#include "utils/common.hpp"

#include <cctype>

std::vector<std::string> SampleReader::split_fields(const std::string& line, char delimiter) {
    std::vector<std::string> fields;

    if( delimiter != '\0' ){
        size_t start = 0;
        while( true ){
            size_t pos = line.find(delimiter, start);
            if( pos == std::string::npos ){
                fields.push_back(line.substr(start));
                break;
            }
            fields.push_back(line.substr(start, pos - start));
            start = pos + 1;
        }
        return fields;
    }

    size_t i = 0;
    while( i < line.size() ){
        while( i < line.size() && isspace((unsigned char)line[i]) ) i++;
        size_t start = i;
        while( i < line.size() && !isspace((unsigned char)line[i]) ) i++;
        if( i > start ){
            fields.push_back(line.substr(start, i - start));
        }
    }
    return fields;
}

/**
 * @brief Extracts one field from a line, with bounds checking.
 * @param line Input line without the trailing newline.
 * @param field 1-based field index, 0 = whole line.
 * @param delimiter Field separator, '\0' = whitespace runs.
 * @return Selected field.
 * @throws FieldError If the field does not exist or is empty.
 */
std::string SampleReader::select_field(const std::string& line, size_t field, char delimiter) {
    if( field == 0 ){
        return line;
    }

    const std::vector<std::string> fields = split_fields(line, delimiter);
    if( field > fields.size() || fields[field-1].empty() ){
        throw FieldError(fmt::format("field {} has no value (line has {} fields)", field, fields.size()));
    }
    return fields[field-1];
}

/**
 * @brief Reads the next sample.
 *
 * Blocks until a full line is available. A final line without a newline is
 * still a sample.
 *
 * @param sample Receives the sample text.
 * @return False at end of input.
 */
bool SampleReader::next(std::string& sample) {
    std::string line;
    if( !std::getline(m_in, line) ){
        return false;
    }
    m_lines++;

    if( !line.empty() && line.back() == '\r' ){
        line.pop_back();
    }

    sample = select_field(line, m_field, m_delimiter);
    logger->trace("line {}: \"{}\" -> \"{}\"", m_lines, line, sample);
    return true;
}
