#pragma once

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace rlscript {

// Receives the text written by `print`, one line per call.
class output_sink {
public:
    virtual ~output_sink() = default;
    virtual void write_line(std::string_view line) = 0;
};

class stream_output_sink final : public output_sink {
public:
    explicit stream_output_sink(std::ostream& out) : out_(out) {}

    void write_line(std::string_view line) override;

private:
    std::ostream& out_;
};

class buffer_output_sink final : public output_sink {
public:
    void write_line(std::string_view line) override;

    [[nodiscard]] const std::vector<std::string>& lines() const noexcept { return lines_; }
    [[nodiscard]] std::string joined(std::string_view separator = "\n") const;
    void clear() noexcept { lines_.clear(); }

private:
    std::vector<std::string> lines_;
};

}  // namespace rlscript
