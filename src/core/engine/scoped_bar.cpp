#include "scoped_bar.hpp"
#include <spdlog/spdlog.h>

namespace tickbar::core {

ScopedBar::ScopedBar(ProgressEngine& engine, std::int64_t total,
                     std::string_view description, std::uint32_t flags)
    : engine_(&engine)
    , total_(total > 0 ? total : 0)
{
    auto created = (flags & kAsync) ? engine.create_async(total, description, flags)
                                    : engine.create(total, description, flags);
    if (created) {
        handle_ = *created;
    } else {
        spdlog::warn("progress bar unavailable, counting only: {}", created.error().message);
    }
}

ScopedBar::~ScopedBar() {
    close();
}

ScopedBar::ScopedBar(ScopedBar&& other) noexcept
    : engine_(other.engine_)
    , handle_(std::exchange(other.handle_, Handle{}))
    , total_(other.total_)
    , n_(other.n_)
{
}

ScopedBar& ScopedBar::operator=(ScopedBar&& other) noexcept {
    if (this != &other) {
        close();
        engine_ = other.engine_;
        handle_ = std::exchange(other.handle_, Handle{});
        total_ = other.total_;
        n_ = other.n_;
    }
    return *this;
}

auto ScopedBar::update(std::int64_t n) -> std::int64_t {
    if (!handle_) {
        n_ += n;
        return n_;
    }
    auto res = engine_->update(handle_, n);
    n_ = res ? *res : n_ + n;
    return n_;
}

void ScopedBar::set_description(std::string_view description) {
    if (handle_) (void)engine_->set_description(handle_, description);
}

void ScopedBar::refresh() {
    if (handle_) (void)engine_->render(handle_);
}

void ScopedBar::write(std::string_view message) {
    if (handle_) (void)engine_->write_message(handle_, message);
}

void ScopedBar::close() {
    if (!handle_) return;
    // Для async-бара значение берётся до close: после него handle недействителен
    if (auto final_count = engine_->read(handle_)) {
        n_ = *final_count;
    }
    (void)engine_->close(std::exchange(handle_, Handle{}));
}

} // namespace tickbar::core
