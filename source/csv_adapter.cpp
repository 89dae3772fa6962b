// csv_adapter.cpp - CSV (RFC 4180) -> Sequence of Mapping

#include <diffx/format_adapters.h>
#include <diffx/builders.h>
#include <diffx/error.h>

#include <string>
#include <vector>

namespace diffx {

namespace {

using Record = std::vector<std::string>;

class CsvReader {
public:
    explicit CsvReader(std::string_view text) : text_(text) {}

    /// Next non-blank record; false at end of input
    bool next(Record& record) {
        while (pos_ < text_.size()) {
            ++line_;
            if (at_line_end()) {
                skip_line_end();
                continue;
            }
            record.clear();
            read_record(record);
            return true;
        }
        return false;
    }

    std::size_t line() const { return line_; }

private:
    std::string_view text_;
    std::size_t pos_ = 0;
    std::size_t line_ = 0;

    [[noreturn]] void fail(const std::string& what) const {
        const std::string message = what + " at line " + std::to_string(line_);
        detail::log_access_error("parse_csv", message);
        throw ParseError("csv", message);
    }

    // "\n", "\r\n", or a bare "\r" ending the input
    bool at_line_end() const {
        if (text_[pos_] == '\n') return true;
        if (text_[pos_] != '\r') return false;
        return pos_ + 1 == text_.size() || text_[pos_ + 1] == '\n';
    }

    void skip_line_end() {
        if (text_[pos_] == '\r') ++pos_;
        if (pos_ < text_.size() && text_[pos_] == '\n') ++pos_;
    }

    void read_record(Record& record) {
        while (true) {
            const bool quoted = pos_ < text_.size() && text_[pos_] == '"';
            record.push_back(quoted ? read_quoted() : read_plain());
            if (pos_ >= text_.size()) return;
            if (text_[pos_] == ',') {
                ++pos_;
                continue;
            }
            // at_line_end() holds here
            skip_line_end();
            return;
        }
    }

    std::string read_plain() {
        const std::size_t start = pos_;
        while (pos_ < text_.size() && text_[pos_] != ',' && !at_line_end()) {
            ++pos_;
        }
        return std::string(text_.substr(start, pos_ - start));
    }

    std::string read_quoted() {
        ++pos_;  // opening quote
        const std::size_t start_line = line_;
        std::string field;
        while (true) {
            if (pos_ >= text_.size()) {
                line_ = start_line;
                fail("unterminated quoted field");
            }
            const char c = text_[pos_++];
            if (c == '"') {
                if (pos_ < text_.size() && text_[pos_] == '"') {
                    field += '"';
                    ++pos_;
                    continue;
                }
                break;
            }
            if (c == '\n') ++line_;
            field += c;
        }
        if (pos_ < text_.size() && text_[pos_] != ',' && !at_line_end()) {
            fail("unexpected character after closing quote");
        }
        return field;
    }
};

} // anonymous namespace

Value parse_csv(std::string_view content)
{
    CsvReader reader(content);
    VectorBuilder rows;

    Record header;
    if (!reader.next(header)) {
        return rows.finish();
    }

    Record record;
    while (reader.next(record)) {
        if (record.size() != header.size()) {
            const std::string message = "row at line " + std::to_string(reader.line()) + " has " +
                                        std::to_string(record.size()) + " fields, expected " +
                                        std::to_string(header.size());
            detail::log_access_error("parse_csv", message);
            throw ParseError("csv", message);
        }
        MapBuilder row;
        for (std::size_t i = 0; i < header.size(); ++i) {
            row.set(header[i], Value{record[i]});
        }
        rows.push_back(row.finish());
    }

    return rows.finish();
}

} // namespace diffx
