#include "LoaderContext.hpp"
#include "GroupLoader.hpp"
#include "CallbackQueue.hpp"
#include "LogManager.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>

int main(int argc, char* argv[])
{
    if (argc < 3)
    {
        std::cerr << "Usage: " << argv[0] << " <config.json> <manifest.json>" << std::endl;
        return -1;
    }

    std::cout << "Starting gload_demo..." << std::endl;

    gload::LoaderContextPtr ctx;
    std::vector<gload::RequestSpec> manifest;
    try
    {
        ctx = gload::make_loader_context(argv[1]);
        manifest = gload::load_manifest(argv[2], ctx->config.request_defaults);
    }
    catch (const gload::ConfigError& e)
    {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return -1;
    }

    auto& loader = *ctx->loader;
    loader.on_batch_finished([](const gload::BatchFinishedEvent& e)
        {
            std::cout << "Batch " << e.result.batch_id << " finished in "
                << std::fixed << std::setprecision(3) << e.result.elapsed.count() << " s" << std::endl;
        });

    auto start = loader.load_many(std::move(manifest));
    if (!start)
    {
        std::cerr << "Loader is busy." << std::endl;
        return -1;
    }

    // Host loop: deliveries run here in queue mode, on the strand otherwise
    float last_progress = -1.0f;
    while (start.done.wait_for(std::chrono::seconds(0)) != std::future_status::ready)
    {
        ctx->callback_queue->wait_for_work(std::chrono::milliseconds(100));
        ctx->pump();

        if (float p = loader.progress(); p != last_progress)
        {
            std::cout << "Progress " << std::setw(5) << std::setprecision(1) << p * 100.0f << " %" << std::endl;
            last_progress = p;
        }
    }

    const auto& report = start.done.get();
    for (const auto& item : report.results)
    {
        std::cout << (item.success ? "  ok   " : "  FAIL ") << item.name;
        if (item.from_cache) std::cout << " (cached)";
        if (item.materialized) std::cout << " (instance)";
        if (!item.success) std::cout << ": " << gload::to_string(item.error) << ", " << item.message;
        std::cout << std::endl;
    }
    std::cout << loader.to_string() << std::endl;

    std::cout << "Exiting gload_demo." << std::endl;
    return report.success ? 0 : 1;
}
