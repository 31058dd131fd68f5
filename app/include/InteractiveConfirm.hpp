#ifndef INTERACTIVE_CONFIRM_HPP
#define INTERACTIVE_CONFIRM_HPP

#include "DateParser.hpp"
#include "Types.hpp"

#include <filesystem>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

#include <spdlog/logger.h>

/**
 * @brief Operator prompt for dates the resolver is not sure about.
 *
 * Blocks on a plain read until the operator enters exactly eight digits that
 * form a valid date, or presses Enter to accept the suggestion. There is no
 * retry limit and no timeout.
 */
class InteractiveConfirm {
public:
    using DocumentOpener = std::function<void(const std::filesystem::path&)>;

    InteractiveConfirm(DateParser parser,
                       std::istream& input,
                       std::ostream& output,
                       std::shared_ptr<spdlog::logger> logger = nullptr,
                       DocumentOpener opener = {});

    /**
     * @brief Return the resolved date, asking the operator when the resolution needs it.
     * @throws ErrorCodes::AppException PROCESSING_INTERRUPTED when input closes or a signal arrives.
     */
    DateCandidate confirm(const DateResolution& resolution,
                          const std::filesystem::path& document) const;

private:
    std::string build_prompt(const std::optional<DateCandidate>& suggested,
                             const std::filesystem::path& document) const;
    void warn(const std::string& message) const;

    DateParser parser_;
    std::istream& input_;
    std::ostream& output_;
    std::shared_ptr<spdlog::logger> logger_;
    DocumentOpener opener_;
};

#endif
