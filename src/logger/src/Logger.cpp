// /////////////////////////////////////////////////////////////////////////////
/// @file Logger.cpp
/// @brief Logger implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rlog/logger/Logger.hpp>
#include <rlog/logger/KeyTypeRegistry.hpp>
#include <rlog/core/Assert.hpp>
#include <rlog/core/Log.hpp>

#include <string>
#include <utility>

namespace rlog::logger {

struct Logger::Impl
{
    LoggerConfig config;
    KeyTypeRegistry keyTypes;
    log::LogTable outputs;
    core::u64 cycle{0};
    bool replayFinished{false};

    explicit Impl(LoggerConfig cfg) : config{std::move(cfg)} {}

    [[nodiscard]] bool replaying() const noexcept { return config.replaySource() != nullptr; }
};

Logger::Logger(LoggerConfig config)
    : impl_{std::make_unique<Impl>(std::move(config))}
{
    core::Log::info("Logger", impl_->replaying() ? "replay mode" : "record mode");
}

Logger::~Logger() = default;

bool Logger::hasReplaySource() const noexcept
{
    return impl_->replaying();
}

core::u64 Logger::cycle() const noexcept
{
    return impl_->cycle;
}

bool Logger::replayFinished() const noexcept
{
    return impl_->replayFinished;
}

void Logger::processInputs(std::string_view prefix, log::ILoggableInputs& inputs)
{
    if (impl_->replaying())
    {
        const log::LogTable table = impl_->config.replaySource()->fetch(prefix, impl_->cycle);
        inputs.fromLog(table);
        dispatch(prefix, table);
        return;
    }

    log::LogTable table;
    inputs.toLog(table);

    if (impl_->config.checkKeyTypes())
    {
        const auto checked = impl_->keyTypes.check(prefix, table);
        if (!checked.has_value())
        {
            core::Log::fatal("Logger", checked.error().message());
        }
        RLOG_VERIFY(checked.has_value());
    }

    dispatch(prefix, table);
}

void Logger::periodicBeforeUser()
{
    if (!impl_->replaying() || impl_->replayFinished)
    {
        return;
    }

    if (!impl_->config.replaySource()->hasCycle(impl_->cycle))
    {
        impl_->replayFinished = true;
        core::Log::info("Logger", "replay finished at cycle " + std::to_string(impl_->cycle));
    }
}

void Logger::periodicAfterUser()
{
    if (!impl_->outputs.empty())
    {
        dispatch(impl_->replaying() ? kReplayOutputsPrefix : kRealOutputsPrefix, impl_->outputs);
        impl_->outputs.clear();
    }
    ++impl_->cycle;
}

log::LogTable& Logger::outputs() noexcept
{
    return impl_->outputs;
}

void Logger::dispatch(std::string_view prefix, const log::LogTable& table)
{
    for (auto* sink : impl_->config.sinks())
    {
        const auto result = sink->putTable(impl_->cycle, prefix, table);
        if (!result.has_value())
        {
            core::Log::warn("Logger", "sink rejected '" + std::string{prefix} + "': "
                                          + result.error().message());
        }
    }
}

} // namespace rlog::logger
