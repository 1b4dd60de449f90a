#include <transfer/progress_channel.hpp>

namespace Transfer
{
    void ProgressChannel::push(std::string message)
    {
        {
            std::scoped_lock lock{mutex_};
            if (closed_)
                return;
            messages_.push_back(std::move(message));
        }
        condition_.notify_one();
    }

    void ProgressChannel::close()
    {
        {
            std::scoped_lock lock{mutex_};
            closed_ = true;
        }
        condition_.notify_all();
    }

    std::optional<std::string> ProgressChannel::next()
    {
        std::unique_lock lock{mutex_};
        condition_.wait(lock, [this]() {
            return closed_ || !messages_.empty();
        });
        if (messages_.empty())
            return std::nullopt;

        auto message = std::move(messages_.front());
        messages_.pop_front();
        return message;
    }

    std::optional<std::string> ProgressChannel::tryNext()
    {
        std::scoped_lock lock{mutex_};
        if (messages_.empty())
            return std::nullopt;

        auto message = std::move(messages_.front());
        messages_.pop_front();
        return message;
    }

    bool ProgressChannel::closed() const
    {
        std::scoped_lock lock{mutex_};
        return closed_;
    }
}
