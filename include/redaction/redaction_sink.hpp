#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <string_view>
#include <type_traits>
#include <utility>

namespace dataprivacy {

/**
 * @brief Output end of a redaction: receives already-redacted fragments
 *
 * Wraps a caller callback taking std::string_view. The callback may return
 * void (never fails) or bool (false = the write failed). After the first
 * failure every further write is dropped, so a redactor can never keep
 * pushing text into a broken sink. Exceptions thrown by the callback are
 * not caught here.
 */
class RedactionSink {
public:
    using Callback = std::function<bool(std::string_view)>;

    template<typename F>
        requires std::invocable<F&, std::string_view>
              && (!std::same_as<std::remove_cvref_t<F>, RedactionSink>)
    RedactionSink(F&& fn) {  // NOLINT(google-explicit-constructor): lambdas convert implicitly
        using R = std::invoke_result_t<F&, std::string_view>;
        if constexpr (std::is_void_v<R>) {
            output_ = [f = std::forward<F>(fn)](std::string_view chunk) mutable {
                f(chunk);
                return true;
            };
        } else {
            static_assert(std::is_convertible_v<R, bool>,
                          "sink callback must return void or bool");
            output_ = [f = std::forward<F>(fn)](std::string_view chunk) mutable {
                return static_cast<bool>(f(chunk));
            };
        }
    }

    /**
     * @brief Write a redacted fragment
     * @return false if this or any earlier write failed
     */
    bool write(std::string_view chunk) {
        if (failed_) return false;
        if (!output_(chunk)) {
            failed_ = true;
            return false;
        }
        bytes_written_ += chunk.size();
        return true;
    }

    [[nodiscard]] bool failed() const noexcept { return failed_; }
    [[nodiscard]] size_t bytes_written() const noexcept { return bytes_written_; }

private:
    Callback output_;
    bool failed_ = false;
    size_t bytes_written_ = 0;
};

} // namespace dataprivacy
