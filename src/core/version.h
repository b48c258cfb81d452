#pragma once

#define DRIFT_VERSION "0.3.0"
#define DRIFT_USER_AGENT "drift/" DRIFT_VERSION
