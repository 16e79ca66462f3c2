#include <libstackfmt/source.hpp>
#include <fstream>
#include <sstream>

std::string_view stackfmt::trim_whitespace(std::string_view text) {
    constexpr std::string_view whitespace = " \t\n\v\f\r";
    auto first = text.find_first_not_of(whitespace);
    if (first == std::string_view::npos) return {};
    auto last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

void stackfmt::source_cache::load(const std::filesystem::path& file) {
    cached_file_.reset();
    lines_.clear();

    std::error_code ec;
    if (std::filesystem::is_directory(file, ec)) return;

    std::ifstream in(file, std::ios::binary);
    if (!in) return;
    std::stringstream contents;
    contents << in.rdbuf();
    if (in.bad()) return;

    auto data = contents.str();
    std::string_view remaining = data;
    while (true) {
        auto newline = remaining.find('\n');
        lines_.emplace_back(remaining.substr(0, newline));
        if (newline == std::string_view::npos) break;
        remaining.remove_prefix(newline + 1);
    }
    cached_file_ = file;
}

std::optional<std::string> stackfmt::source_cache::line(
    const std::filesystem::path& file, std::int64_t line) {
    if (!cached_file_ or *cached_file_ != file) {
        load(file);
    }

    auto index = line - 1;
    if (index < 0 or static_cast<std::size_t>(index) >= lines_.size()) {
        return std::nullopt;
    }
    return std::string(trim_whitespace(lines_[index]));
}
