#pragma once

// Log levels are:
//
// 0  CRITICAL Display the message irrespective of the log level.
// 1  ERROR Major errors that should be displayed to the user.
// 2  WARN Any error suitable for display to a developer or technically minded user (default).
// 3  Application log message, level 1
// 4  INFO Application log message, level 2
// 5  API Top-level API messages, e.g. function entry points
// 6  DETAIL Detailed API messages.  For messages within functions, and entry-points for minor functions.
// 8  TRACE Extremely detailed API messages suitable for intensive debugging only.
// 9  Noisy debug messages that will appear frequently, e.g. being used in inner loops.

#include <stdarg.h>
#include <morphic/system/types.h>
#include <morphic/system/errors.h>

namespace mx {

enum class VLF : uint32_t {
   NIL = 0,
   BRANCH = 0x00000001,
   ERROR = 0x00000002,
   WARNING = 0x00000004,
   CRITICAL = 0x00000008,
   INFO = 0x00000010,
   API = 0x00000020,
   DETAIL = 0x00000040,
   TRACE = 0x00000080,
   FUNCTION = 0x00000100,
};

DEFINE_ENUM_FLAG_OPERATORS(VLF)

extern void VLogF(VLF Flags, CSTRING Header, CSTRING Message, va_list Args);
extern ERR FuncError(CSTRING Header, ERR Code);
extern void LogReturn(void);
extern int AdjustLogLevel(int Delta);
extern void SetLogLevel(int Level);
extern int GetLogLevel(void);
extern ERR ParseLogLevel(CSTRING Value, int &Level);

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-zero-length"

class Log { // Scoped logger.  Branches opened by this object are closed on destruction.
   private:
      int branches;
      CSTRING header;

   public:
      Log() : branches(0), header(nullptr) { }
      Log(CSTRING Header) : branches(0), header(Header) { }

      ~Log() {
         while (branches > 0) { branches--; LogReturn(); }
      }

      void branch(CSTRING Message = "", ...) __attribute__((format(printf, 2, 3))) {
         va_list arg;
         va_start(arg, Message);
         VLogF(VLF::API|VLF::BRANCH, header, Message, arg);
         va_end(arg);
         branches++;
      }

      #ifndef NDEBUG
      void traceBranch(CSTRING Message = "", ...) __attribute__((format(printf, 2, 3))) {
         va_list arg;
         va_start(arg, Message);
         VLogF(VLF::TRACE|VLF::BRANCH, header, Message, arg);
         va_end(arg);
         branches++;
      }
      #else
      void traceBranch(CSTRING Message = "", ...) __attribute__((format(printf, 2, 3))) { }
      #endif

      inline void debranch() {
         branches--;
         LogReturn();
      }

      void msg(CSTRING Message, ...) __attribute__((format(printf, 2, 3))) { // API level
         va_list arg;
         va_start(arg, Message);
         VLogF(VLF::API, header, Message, arg);
         va_end(arg);
      }

      void detail(CSTRING Message, ...) __attribute__((format(printf, 2, 3))) {
         va_list arg;
         va_start(arg, Message);
         VLogF(VLF::DETAIL, header, Message, arg);
         va_end(arg);
      }

      void warning(CSTRING Message, ...) __attribute__((format(printf, 2, 3))) {
         va_list arg;
         va_start(arg, Message);
         VLogF(VLF::WARNING, header, Message, arg);
         va_end(arg);
      }

      void error(CSTRING Message, ...) __attribute__((format(printf, 2, 3))) {
         va_list arg;
         va_start(arg, Message);
         VLogF(VLF::ERROR, header, Message, arg);
         va_end(arg);
      }

      inline ERR warning(ERR Code) {
         FuncError(header, Code);
         return Code;
      }

      inline ERR error(ERR Code) {
         FuncError(header, Code);
         return Code;
      }

      void trace(CSTRING Message, ...) __attribute__((format(printf, 2, 3))) {
         #ifndef NDEBUG
            va_list arg;
            va_start(arg, Message);
            VLogF(VLF::TRACE, header, Message, arg);
            va_end(arg);
         #endif
      }

      inline ERR traceWarning(ERR Code) {
         #ifndef NDEBUG
            FuncError(header, Code);
         #endif
         return Code;
      }
};

#pragma GCC diagnostic pop

class LogLevel {
   private:
      int level;
   public:
      LogLevel(int Level) : level(Level) {
         AdjustLogLevel(Level);
      }

      ~LogLevel() {
         AdjustLogLevel(-level);
      }
};

} // namespace
