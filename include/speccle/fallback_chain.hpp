#pragma once

#include "speccle/logging.hpp"
#include "speccle/source_error.hpp"

#include <QString>

#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace speccle {

// One information source for a category. Returning std::nullopt means the
// source does not exist here; throwing SourceException says why it failed.
template <typename T>
struct Probe {
    std::string source;
    std::function<std::optional<T>()> read;
};

// Evaluates probes in order until one yields a validated value. When a gap
// filler is set, a validated but incomplete value keeps the chain going and
// later probes only fill the fields still missing.
template <typename T>
class FallbackChain {
public:
    using Validator = std::function<bool(const T&)>;
    using Completeness = std::function<bool(const T&)>;
    using GapFiller = std::function<void(T&, const T&)>;

    FallbackChain(std::string category, std::vector<Probe<T>> probes)
        : category_(std::move(category)), probes_(std::move(probes)) {}

    FallbackChain& validateWith(Validator validator) {
        validator_ = std::move(validator);
        return *this;
    }

    FallbackChain& fillGapsWith(Completeness isComplete, GapFiller filler) {
        isComplete_ = std::move(isComplete);
        filler_ = std::move(filler);
        return *this;
    }

    std::optional<T> resolve() const {
        if (probes_.empty()) {
            qCInfo(lcCollector).noquote() << QString::fromStdString(category_) << "has no source on this platform:"
                                          << sourceErrorName(SourceError::UnsupportedPlatform);
            return std::nullopt;
        }

        std::optional<T> result;
        for (const auto& probe : probes_) {
            std::optional<T> value = attempt(probe);
            if (!value) {
                continue;
            }

            if (!result) {
                result = std::move(value);
            } else if (filler_) {
                filler_(*result, *value);
            }

            if (!isComplete_ || isComplete_(*result)) {
                return result;
            }
            qCDebug(lcCollector).noquote() << QString::fromStdString(category_) << "partial after"
                                           << QString::fromStdString(probe.source);
        }

        if (!result) {
            qCInfo(lcCollector).noquote() << QString::fromStdString(category_) << "resolved to Unknown";
        }
        return result;
    }

private:
    std::optional<T> attempt(const Probe<T>& probe) const {
        const QString where = QString::fromStdString(category_ + "/" + probe.source);
        try {
            std::optional<T> value = probe.read();
            if (!value) {
                qCDebug(lcCollector).noquote() << where << sourceErrorName(SourceError::SourceUnavailable);
                return std::nullopt;
            }
            if (validator_ && !validator_(*value)) {
                qCDebug(lcCollector).noquote() << where << sourceErrorName(SourceError::InvalidValue);
                return std::nullopt;
            }
            return value;
        } catch (const SourceException& e) {
            qCDebug(lcCollector).noquote() << where << sourceErrorName(e.error()) << e.what();
        } catch (const std::exception& e) {
            qCDebug(lcCollector).noquote() << where << "failed:" << e.what();
        } catch (...) {
            // COM wrappers throw _com_error, which is not a std::exception.
            qCDebug(lcCollector).noquote() << where << "failed with a non-standard exception";
        }
        return std::nullopt;
    }

    std::string category_;
    std::vector<Probe<T>> probes_;
    Validator validator_;
    Completeness isComplete_;
    GapFiller filler_;
};

} // namespace speccle
