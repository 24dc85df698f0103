#include "terminal.hpp"
#include <cerrno>
#include <cstring>
#include <string>
#include <fmt/core.h>
#include <unistd.h>

namespace tickbar::adapters::terminal {

namespace {

auto framed(std::string_view line, std::string_view tail) -> std::string {
    std::string out;
    out.reserve(kReturnClear.size() + line.size() + tail.size());
    out.append(kReturnClear);
    out.append(line);
    out.append(tail);
    return out;
}

} // namespace

auto write_all(int fd, std::string_view data) -> std::expected<void, infra::Error> {
    const char* ptr = data.data();
    std::size_t left = data.size();

    while (left > 0) {
        ssize_t written = ::write(fd, ptr, left);
        if (written < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(infra::make_error(infra::ErrorCode::WriteFailed,
                fmt::format("write(fd={}) failed: {}", fd, std::strerror(errno))));
        }
        ptr += written;
        left -= static_cast<std::size_t>(written);
    }
    return {};
}

auto draw_line(int fd, std::string_view line) -> std::expected<void, infra::Error> {
    return write_all(fd, framed(line, {}));
}

auto finish_line(int fd, std::string_view line) -> std::expected<void, infra::Error> {
    return write_all(fd, framed(line, "\n"));
}

auto clear_line(int fd) -> std::expected<void, infra::Error> {
    return write_all(fd, kReturnClear);
}

auto write_message(int fd, std::string_view message) -> std::expected<void, infra::Error> {
    return write_all(fd, framed(message, "\n"));
}

} // namespace tickbar::adapters::terminal
