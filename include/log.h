#pragma once

// Log macros shared by the discovery core and the firmware glue.
// On target they go through the ESP32 core logger (Serial console),
// on host builds to stderr.
#if defined(ARDUINO)
  #include <esp32-hal-log.h>
  #define LOG_E(fmt, ...)  log_e(fmt, ##__VA_ARGS__)
  #define LOG_W(fmt, ...)  log_w(fmt, ##__VA_ARGS__)
  #define LOG_I(fmt, ...)  log_i(fmt, ##__VA_ARGS__)
  #define LOG_D(fmt, ...)  log_d(fmt, ##__VA_ARGS__)
#else
  #include <stdio.h>
  #define LOG_E(fmt, ...)  fprintf(stderr, "[E][%s] " fmt "\n", __func__, ##__VA_ARGS__)
  #define LOG_W(fmt, ...)  fprintf(stderr, "[W][%s] " fmt "\n", __func__, ##__VA_ARGS__)
  #define LOG_I(fmt, ...)  fprintf(stderr, "[I][%s] " fmt "\n", __func__, ##__VA_ARGS__)
  #if defined(NEARPAY_HOST_DEBUG)
    #define LOG_D(fmt, ...)  fprintf(stderr, "[D][%s] " fmt "\n", __func__, ##__VA_ARGS__)
  #else
    #define LOG_D(fmt, ...)  do {} while (0)
  #endif
#endif
