// /////////////////////////////////////////////////////////////////////////////
/// @file LoggerConfig.hpp
/// @brief Logger configuration (Builder pattern).
///
/// The presence of a replay source selects replay mode for the whole run.
/// Sources and sinks are borrowed: they must outlive the Logger.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rlog/serial/ILogSink.hpp>
#include <rlog/serial/IReplaySource.hpp>

#include <vector>

namespace rlog::logger {

/// @brief Immutable logger configuration.
class LoggerConfig
{
public:
    /// @brief Fluent builder for LoggerConfig.
    class Builder
    {
    public:
        Builder& replaySource(const serial::IReplaySource* source) noexcept;
        Builder& addSink(serial::ILogSink* sink);
        Builder& checkKeyTypes(bool enabled) noexcept;

        [[nodiscard]] LoggerConfig build() const;

    private:
        const serial::IReplaySource* replaySource_{nullptr};
        std::vector<serial::ILogSink*> sinks_;
        bool checkKeyTypes_{true};
    };

    [[nodiscard]] const serial::IReplaySource* replaySource() const noexcept { return replaySource_; }
    [[nodiscard]] const std::vector<serial::ILogSink*>& sinks() const noexcept { return sinks_; }
    [[nodiscard]] bool checkKeyTypes() const noexcept { return checkKeyTypes_; }

private:
    friend class Builder;

    const serial::IReplaySource* replaySource_{nullptr};
    std::vector<serial::ILogSink*> sinks_;
    bool checkKeyTypes_{true};
};

} // namespace rlog::logger
