#pragma once

/**
 * fablecore mechanics library
 *
 * Main include file - includes all public headers.
 */

// Errors, logging, configuration
#include "errors.hpp"
#include "validation.hpp"
#include "logging.hpp"
#include "config.hpp"

// Event helpers and rendering
#include "helpers.hpp"
#include "event_renderer.hpp"

// Rules
#include "dice.hpp"
#include "skill_check.hpp"
#include "combat_engine.hpp"
#include "inventory.hpp"

// Sessions and persistence
#include "timeline.hpp"
#include "session.hpp"
#include "session_store.hpp"
#include "in_memory_session_store.hpp"
#include "json_file_session_store.hpp"
#include "session_repository.hpp"
#include "mechanics.hpp"
#include "session_service.hpp"

// Streaming
#include "tag_filter.hpp"
#include "token_channel.hpp"
#include "stream_coordinator.hpp"
#include "action_intent_resolver.hpp"
#include "rendering_narrator.hpp"
