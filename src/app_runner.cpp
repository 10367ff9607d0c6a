#include "app_runner.hpp"
#include "logger.hpp"

#include <csignal>
#include <sstream>

CAppRunner::CAppRunner(int argc, char** argv)
    : m_argc(argc), m_argv(argv) {}

int CAppRunner::Run() {
    if (!LoadAndValidateConfig()) {
        return 1;
    }

    //Console report may write to a closed pipe
    std::signal(SIGPIPE, SIG_IGN);
    m_signals = std::make_unique<boost::asio::signal_set>(m_ioc, SIGINT, SIGTERM);

    BuildPipeline();
    m_pipeline->Start();

    bool ok = RunSyntheticSource();

    try {
        m_pipeline->Stop();
    } catch (const std::exception& e) {
        Log(LogLevel::ERROR, "Main", "Aggregation failed: " + std::string(e.what()));
        ok = false;
    }
    m_signals.reset();

    LogSummary();
    Log(LogLevel::INFO, "Main", "hourly_high stopped.");
    return ok ? 0 : 1;
}

void CAppRunner::SetupSignalHandler() {
    m_signals->async_wait([this](const boost::system::error_code& ec, int /*signo*/) {
        if (ec) return;

        Log(LogLevel::INFO, "Main", "Shutdown signal received.");
        m_keep_running.store(false);
        m_ioc.stop();
    });
}

bool CAppRunner::LoadAndValidateConfig() {
    try {
        m_cfg = LoadConfig(m_argc, m_argv);
    } catch (const std::exception& e) {
        Log(LogLevel::ERROR, "Config", "Failed to load config: " + std::string(e.what()));
        return false;
    }
    if (!ValidateConfig(m_cfg)) {
        Log(LogLevel::ERROR, "Config", "Validation failed.");
        return false;
    }
    return true;
}

void CAppRunner::BuildPipeline() {
    m_pipeline = std::make_unique<CAggregationPipeline>(m_cfg.engine, m_cfg.source.num_categories);
    m_table = std::make_shared<CTableSink>();
    m_pipeline->Subscribe(m_table);
    m_pipeline->Subscribe(std::make_shared<CFileSink>(m_cfg.output));
    if (m_cfg.output.log_diffs) {
        m_pipeline->Subscribe(std::make_shared<CLogSink>());
    }
}

bool CAppRunner::RunSyntheticSource() {
    SetupSignalHandler();

    std::atomic<bool> ok{true};
    m_source = std::thread([this, &ok]() {
        try {
            CSyntheticGenerator generator(m_cfg.source);
            m_generator_stats = generator.Run(*m_pipeline->Session(), m_keep_running);
        } catch (const std::exception& e) {
            Log(LogLevel::ERROR, "Generator", "Exception: " + std::string(e.what()));
            ok.store(false);
        }
        boost::asio::post(m_ioc, [this]() { m_ioc.stop(); });
    });

    m_ioc.run();
    // A signal stops the loop before the generator is done.
    m_keep_running.store(false);
    if (m_source.joinable()) {
        m_source.join();
    }
    return ok.load();
}

void CAppRunner::LogSummary() {
    std::ostringstream oss;
    oss << "Processed " << m_pipeline->BatchesProcessed() << " batches, emitted "
        << m_pipeline->DiffsEmitted() << " aggregate diffs, "
        << m_pipeline->Engine().LiveCount() << " live groups (" << m_table->Size() << " in table)."
        << " Generator: " << m_generator_stats.inserted << " inserted, "
        << m_generator_stats.retracted << " retracted.";
    Log(LogLevel::INFO, "Main", oss.str());
}
