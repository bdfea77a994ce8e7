/* Copyright 2024 Tencent Inc.  All rights reserved.

==============================================================================*/

#include <csignal>
#include <iostream>
#include <memory>

#include "ripple_llm/service/engine_simulator.h"
#include "ripple_llm/utils/environment.h"
#include "ripple_llm/utils/logger.h"
#include "ripple_llm/utils/status.h"

using namespace ripple_llm;

static std::shared_ptr<EngineSimulator> simulator = nullptr;

void SignalHandler(int signum) {
  if (simulator) {
    // Skip dup signals.
    signal(SIGINT, SIG_IGN);
    signal(SIGQUIT, SIG_IGN);
    signal(SIGTERM, SIG_IGN);

    simulator->Stop();
  }
}

int main(int argc, char** argv) {
  // Initialize logger.
  InitLoguru();

  // Parse command line options.
  Environment env;
  Status status = env.ParseOptions(argc, argv);
  if (!status.OK()) {
    std::cerr << status.ToString() << std::endl;
    return 1;
  }

  RequestHandlerConfig request_handler_config;
  CacheManagerConfig cache_manager_config;
  GenerationConfig generation_config;
  SimulatorConfig simulator_config;
  if (!env.GetRequestHandlerConfig(request_handler_config).OK() ||
      !env.GetCacheManagerConfig(cache_manager_config).OK() || !env.GetGenerationConfig(generation_config).OK() ||
      !env.GetSimulatorConfig(simulator_config).OK()) {
    std::cerr << "Get config from environment error." << std::endl;
    return 1;
  }

  simulator = std::make_shared<EngineSimulator>(request_handler_config, cache_manager_config, generation_config,
                                                simulator_config);

  // Install signal handler.
  signal(SIGINT, SignalHandler);
  signal(SIGQUIT, SignalHandler);
  signal(SIGTERM, SignalHandler);

  status = simulator->Start();
  if (!status.OK()) {
    RLLM_LOG_ERROR << "Run simulator error: " << status.ToString();
    std::cerr << status.ToString() << std::endl;
    return 1;
  }

  std::cout << "finished " << simulator->GetFinishedNumber() << ", aborted " << simulator->GetAbortedNumber()
            << std::endl;
  return 0;
}
