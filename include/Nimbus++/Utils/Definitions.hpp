#pragma once

#ifndef NIMBUS_VERSION
  #define NIMBUS_VERSION "0.1.0"
#endif

/// User-Agent sent with every upstream request.
#define NIMBUS_USER_AGENT "Nimbus++/" NIMBUS_VERSION

/// Macro alias for trailing return type functions.
#define fn auto
