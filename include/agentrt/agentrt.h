// include/agentrt/agentrt.h
#ifndef AGENTRT_AGENTRT_H
#define AGENTRT_AGENTRT_H

// Public entry point: types, stores, agents, runner, configuration.
// The llama.cpp model lives in "common/llm/llama_adapter.h" (agentrt_llama target).

#include "core/types/content.h"
#include "core/types/errors.h"
#include "core/types/event.h"
#include "core/types/session.h"
#include "core/types/value.h"

#include "common/llm/model_client.h"
#include "common/logging/logger.h"
#include "common/tools/registry.h"
#include "common/utils/template_renderer.h"

#include "modules/agent/base_agent.h"
#include "modules/agent/callbacks.h"
#include "modules/agent/invocation_context.h"
#include "modules/agent/llm_agent.h"
#include "modules/agent/loop_agent.h"
#include "modules/agent/parallel_agent.h"
#include "modules/agent/sequential_agent.h"
#include "modules/artifact/in_memory_artifact_store.h"
#include "modules/config/app_config.h"
#include "modules/loader/agent_loader.h"
#include "modules/memory/in_memory_memory_store.h"
#include "modules/runner/runner.h"
#include "modules/session/in_memory_session_store.h"
#include "modules/session/sqlite_session_store.h"
#include "modules/state/state.h"

#endif // AGENTRT_AGENTRT_H
