/***********************************************************
 * Author: Dr. Eric O. Flores
 * Date: 2025-09-06
 * Description: Application metadata shared by the window,
 *              the logs and the command line.
 * License: MIT
 * **********************************************************/

#pragma once

// -----------------------------
// App metadata
// -----------------------------
static const char* const APP_NAME   = "y-cruncher Stress GUI";
static const char* const APP_ID     = "ycruncher-gui";
static const char* const VERSION    = YCGUI_VERSION;
static const char* const REVISION   = "2025-09-06";
static const char* const AUTHOR     = "Dr. Eric O. Flores";
