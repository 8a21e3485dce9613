/**
 * @file download_result.h
 * @brief Terminal outcome of a download operation
 */

#ifndef KCENON_FILE_DOWNLOADER_CORE_DOWNLOAD_RESULT_H
#define KCENON_FILE_DOWNLOADER_CORE_DOWNLOAD_RESULT_H

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>

#include "kcenon/file_downloader/core/error_codes.h"
#include "kcenon/file_downloader/core/types.h"

namespace kcenon::file_downloader {

/**
 * @brief Exception raised by remote clients for protocol level failures
 */
class remote_exception : public std::runtime_error {
public:
    remote_exception(error_code code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    explicit remote_exception(error_code code)
        : std::runtime_error(to_string(code)), code_(code) {}

    [[nodiscard]] auto code() const noexcept -> error_code { return code_; }

private:
    error_code code_;
};

/**
 * @brief Underlying cause of a failed download
 *
 * Present only when the failure came from an exception or a transport
 * error. HTTP status failures carry no cause.
 */
struct failure_cause {
    error_code code = error_code::unknown_error;
    std::string description;
};

/**
 * @brief Structured result of a download operation
 */
class download_result {
public:
    download_result() = default;

    [[nodiscard]] static auto ok() -> download_result {
        return download_result{error_code::success, "", std::nullopt};
    }

    [[nodiscard]] static auto cancelled() -> download_result {
        return download_result{error_code::cancelled, to_string(error_code::cancelled),
                               std::nullopt};
    }

    [[nodiscard]] static auto failure(error_code code, std::string message = {}) -> download_result {
        if (message.empty()) {
            message = to_string(code);
        }
        return download_result{code, std::move(message), std::nullopt};
    }

    [[nodiscard]] static auto failure_with_cause(error_code code, failure_cause cause)
        -> download_result {
        std::string message = cause.description.empty() ? to_string(code) : cause.description;
        return download_result{code, std::move(message), std::move(cause)};
    }

    /**
     * @brief Convert an exception raised while downloading to a result
     *
     * remote_exception keeps its code, anything else becomes unknown_error.
     */
    [[nodiscard]] static auto from_exception(const std::exception& e) -> download_result {
        if (auto* remote = dynamic_cast<const remote_exception*>(&e)) {
            return failure_with_cause(remote->code(),
                                      failure_cause{remote->code(), remote->what()});
        }
        return failure_with_cause(error_code::unknown_error,
                                  failure_cause{error_code::unknown_error, e.what()});
    }

    [[nodiscard]] auto code() const noexcept -> error_code { return code_; }
    [[nodiscard]] auto message() const -> const std::string& { return message_; }
    [[nodiscard]] auto cause() const -> const std::optional<failure_cause>& { return cause_; }

    [[nodiscard]] auto is_success() const noexcept -> bool { return code_ == error_code::success; }
    [[nodiscard]] auto is_cancelled() const noexcept -> bool { return code_ == error_code::cancelled; }

    /**
     * @brief True only once the work was handed to the retry scheduler
     *
     * A raw failure with error_code::no_network_connection is not deferred.
     */
    [[nodiscard]] auto is_deferred() const noexcept -> bool { return deferred_; }

    /**
     * @brief Replace the outcome with the deferred (no network) code
     *
     * The cause is kept so the original reason stays visible in logs.
     */
    void mark_deferred() {
        deferred_ = true;
        code_ = error_code::no_network_connection;
        message_ = to_string(error_code::no_network_connection);
    }

private:
    download_result(error_code code, std::string message, std::optional<failure_cause> cause)
        : code_(code), message_(std::move(message)), cause_(std::move(cause)) {}

    error_code code_ = error_code::unknown_error;
    std::string message_;
    std::optional<failure_cause> cause_;
    bool deferred_ = false;
};

}  // namespace kcenon::file_downloader

#endif  // KCENON_FILE_DOWNLOADER_CORE_DOWNLOAD_RESULT_H
