#include "rlscript/output.hpp"

namespace rlscript {

void stream_output_sink::write_line(std::string_view line) {
    out_ << line << '\n';
}

void buffer_output_sink::write_line(std::string_view line) {
    lines_.emplace_back(line);
}

std::string buffer_output_sink::joined(std::string_view separator) const {
    std::string out;
    for (std::size_t i = 0; i < lines_.size(); ++i) {
        if (i > 0) {
            out += separator;
        }
        out += lines_[i];
    }
    return out;
}

}  // namespace rlscript
