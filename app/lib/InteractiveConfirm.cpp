#include "InteractiveConfirm.hpp"
#include "AppException.hpp"
#include "ErrorMessages.hpp"
#include "InterruptGuard.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <utility>

#include <fmt/format.h>

namespace {
const std::regex kEightDigits(R"(^\d{8}$)");

std::string trim_copy(const std::string& value) {
    auto result = value;
    const auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    result.erase(result.begin(), std::find_if(result.begin(), result.end(), not_space));
    result.erase(std::find_if(result.rbegin(), result.rend(), not_space).base(), result.end());
    return result;
}
}


InteractiveConfirm::InteractiveConfirm(DateParser parser,
                                       std::istream& input,
                                       std::ostream& output,
                                       std::shared_ptr<spdlog::logger> logger,
                                       DocumentOpener opener)
    : parser_(std::move(parser)),
      input_(input),
      output_(output),
      logger_(std::move(logger)),
      opener_(std::move(opener))
{
}


DateCandidate InteractiveConfirm::confirm(const DateResolution& resolution,
                                          const std::filesystem::path& document) const
{
    if (!resolution.needs_confirmation && resolution.candidate) {
        return *resolution.candidate;
    }

    const std::string label = Utils::path_to_utf8(document);
    const std::string prompt = build_prompt(resolution.candidate, document);
    while (true) {
        InterruptGuard::throw_if_interrupted(label);

        output_ << prompt << std::flush;
        std::string raw_input;
        if (!std::getline(input_, raw_input)) {
            output_ << '\n';
            InterruptGuard::throw_if_interrupted(label);
            THROW_APP_ERROR_MSG(ErrorCodes::Code::PROCESSING_INTERRUPTED,
                                "Operator input closed while confirming the date",
                                label);
        }

        const std::string entry = trim_copy(raw_input);
        if (opener_ && (entry == "o" || entry == "O")) {
            opener_(document);
            continue;
        }

        if (entry.empty() && resolution.candidate) {
            DateCandidate accepted = *resolution.candidate;
            accepted.confident = true;
            if (logger_) {
                logger_->debug("Suggested date stamp accepted: {}", accepted.stamp());
            }
            return accepted;
        }

        if (!std::regex_match(entry, kEightDigits)) {
            warn(MSG_INVALID_DATE_FORMAT);
            continue;
        }

        auto typed = parser_.parse_stamp(entry, DateSource::User);
        if (!typed) {
            warn(MSG_DATE_OUT_OF_RANGE);
            continue;
        }

        typed->confident = true;
        if (logger_) {
            logger_->debug("Date stamp provided manually: {}", typed->stamp());
        }
        return *typed;
    }
}


std::string InteractiveConfirm::build_prompt(const std::optional<DateCandidate>& suggested,
                                             const std::filesystem::path& document) const
{
    std::string prompt = fmt::format(fmt::runtime(MSG_PROMPT_DATE),
                                     Utils::path_to_utf8(document.filename()));
    if (suggested) {
        prompt += " [" + suggested->stamp() + "]";
    }
    if (opener_) {
        prompt += std::string(" (") + MSG_PROMPT_OPEN_HINT + ")";
    }
    prompt += ": ";
    return prompt;
}


void InteractiveConfirm::warn(const std::string& message) const
{
    if (logger_) {
        logger_->warn("{}", message);
    } else {
        output_ << message << '\n';
    }
}
