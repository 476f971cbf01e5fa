#pragma once
// ═══════════════════════════════════════════════════════════════════
//  lanserve/lanserve.h — Umbrella header
// ═══════════════════════════════════════════════════════════════════
//
//  #include "lanserve/lanserve.h"
//  using namespace lanserve;
//
//  Pulls in:
//    • config::parseArgs(), config::Options
//    • content::ContentSpec, content::makeProvider()
//    • archive::write(), tar::Writer, zip::Writer, compress::GzipWriter
//    • lifecycle::Lifecycle, ShutdownCoordinator, InterruptWatcher
//    • http::Server, DownloadHandler
//    • console::info(), warn(), error()
//
// ═══════════════════════════════════════════════════════════════════

// Core
#include "console.h"
#include "io.h"
#include "path.h"
#include "mime.h"
#include "config.h"

// Encoders
#include "compress.h"
#include "tar.h"
#include "zip.h"
#include "archive.h"

// Serving
#include "content.h"
#include "http.h"
#include "lifecycle.h"
#include "handler.h"
#include "network.h"
