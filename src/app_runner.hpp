#pragma once

#include "aggregate_sink.hpp"
#include "aggregation_pipeline.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "synthetic_generator.hpp"

#include <atomic>
#include <memory>
#include <thread>

#include <boost/asio.hpp>

class CAppRunner {
public:
    CAppRunner(int argc, char** argv);
    virtual ~CAppRunner() = default;
    int Run();

protected:
    void SetupSignalHandler();
    virtual bool LoadAndValidateConfig();
    void BuildPipeline();
    bool RunSyntheticSource();
    void LogSummary();

    int m_argc = 0;
    char** m_argv = nullptr;

    SAppConfig m_cfg;

    boost::asio::io_context m_ioc;
    std::unique_ptr<boost::asio::signal_set> m_signals;

    std::unique_ptr<CAggregationPipeline> m_pipeline;
    std::shared_ptr<CTableSink> m_table;
    SGeneratorStats m_generator_stats;

    std::atomic<bool> m_keep_running{true};

    std::thread m_source;
};
