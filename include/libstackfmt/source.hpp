#ifndef STACKFMT_SOURCE_HPP
#define STACKFMT_SOURCE_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stackfmt {
    std::string_view trim_whitespace(std::string_view text);

    // Holds the lines of exactly one source file: the most recently
    // requested one. Asking for a different file replaces the entry, there
    // is no eviction policy beyond that single slot.
    class source_cache {
    public:
        // The trimmed text of the 1-based line `line` of `file`, or nothing
        // when the file cannot be read or the line is out of range.
        std::optional<std::string> line(
            const std::filesystem::path& file, std::int64_t line);

        const std::optional<std::filesystem::path>& cached_file() const {
            return cached_file_;
        }
        std::size_t cached_line_count() const { return lines_.size(); }

    private:
        void load(const std::filesystem::path& file);

        std::optional<std::filesystem::path> cached_file_;
        std::vector<std::string> lines_;
    };
}

#endif
