#ifndef LOG_H
#define LOG_H

#ifdef __EMSCRIPTEN__
  // WASM
  #include <emscripten/emscripten.h>
  #define SUDOPLAY_EXPORT EMSCRIPTEN_KEEPALIVE
  #define SUDOPLAY_WRITE_LOG(fmt, ...) emscripten_log(EM_LOG_CONSOLE, "sudoplay: " fmt, ##__VA_ARGS__)
#else
  // native
  #include <cstdio>
  #define SUDOPLAY_EXPORT
  #define SUDOPLAY_WRITE_LOG(fmt, ...) fprintf(stderr, "sudoplay: " fmt "\n", ##__VA_ARGS__)
#endif

#ifdef SUDOPLAY_QUIET
  #define SUDOPLAY_LOG(fmt, ...) do { } while (0)
#else
  #define SUDOPLAY_LOG(fmt, ...) SUDOPLAY_WRITE_LOG(fmt, ##__VA_ARGS__)
#endif

#endif // LOG_H
