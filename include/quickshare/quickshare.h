#pragma once
// ═══════════════════════════════════════════════════════════════════
//  quickshare/quickshare.h — Umbrella header
// ═══════════════════════════════════════════════════════════════════
//
//  #include "quickshare/quickshare.h"
//  using namespace quickshare;
//
//    • Config, config::applyArguments()
//    • ShareService, ExpirySweeper
//    • routes::createApp()
//    • http::Server, tls::Context
//    • console::info(), warn(), error()
//
// ═══════════════════════════════════════════════════════════════════

// Core
#include "json_utils.h"
#include "console.h"
#include "errors.h"
#include "config.h"

// Engine
#include "entry.h"
#include "storage.h"
#include "metadata_store.h"
#include "share_service.h"
#include "sweeper.h"

// HTTP
#include "http.h"
#include "tls.h"
#include "middleware.h"
#include "routes.h"
#include "lifecycle.h"
