/*********************************************************************************************************************

The source code of the Morphic project is made publicly available under the terms described in the LICENSE.TXT file
that is distributed with this package.  Please refer to it for further information on licensing.

-CATEGORY-
Name: Logging
-END-

This file contains all logging functions.  All output is written to stderr.  Messages are filtered against the
active log level (see log.h for the level table), with warnings and errors always printed if the level is 2 or
higher.

*********************************************************************************************************************/

#include <stdio.h>
#include <string.h>
#include <strings.h>
#include <array>
#include <string>
#include "defs.h"

namespace mx {

static const int COLUMN1 = 30;

enum { MS_NONE, MS_FUNCTION, MS_MSG };

static constexpr std::array<VLF, 10> LOG_LEVELS = {
   VLF::CRITICAL,
   VLF::ERROR|VLF::CRITICAL,
   VLF::WARNING|VLF::ERROR|VLF::CRITICAL,
   VLF::INFO|VLF::WARNING|VLF::ERROR|VLF::CRITICAL,
   VLF::INFO|VLF::WARNING|VLF::ERROR|VLF::CRITICAL,
   VLF::API|VLF::INFO|VLF::WARNING|VLF::ERROR|VLF::CRITICAL,
   VLF::DETAIL|VLF::API|VLF::INFO|VLF::WARNING|VLF::ERROR|VLF::CRITICAL,
   VLF::DETAIL|VLF::API|VLF::INFO|VLF::WARNING|VLF::ERROR|VLF::CRITICAL,
   VLF::TRACE|VLF::DETAIL|VLF::API|VLF::INFO|VLF::WARNING|VLF::ERROR|VLF::CRITICAL,
   VLF::TRACE|VLF::DETAIL|VLF::API|VLF::INFO|VLF::WARNING|VLF::ERROR|VLF::CRITICAL
};

static const struct {
   CSTRING Name;
   int Level;
} glLevelNames[] = {
   { "critical", 0 }, { "error", 1 }, { "warning", 2 }, { "warn", 2 }, { "info", 4 }, { "api", 5 },
   { "detail", 6 }, { "debug", 8 }, { "trace", 8 }
};

static void fmsg(CSTRING, char *, int8_t);

//********************************************************************************************************************

static std::string format_message(CSTRING Message, va_list Args)
{
   if ((!Message) or (!Message[0])) return std::string();

   va_list copy;
   va_copy(copy, Args);
   int required = vsnprintf(nullptr, 0, Message, copy);
   va_end(copy);

   if (required <= 0) return std::string();

   std::string buffer;
   buffer.resize(required);
   va_copy(copy, Args);
   vsnprintf(buffer.data(), buffer.size()+1, Message, copy);
   va_end(copy);
   return buffer;
}

//********************************************************************************************************************

static void print_line(CSTRING Header, int8_t State, bool Highlight, const std::string &Message)
{
   char msgheader[COLUMN1+1];
   fmsg(Header, msgheader, State);

   std::lock_guard lock(glmPrint);
   if (Highlight) fprintf(stderr, "\033[1m%s%s\033[0m\n", msgheader, Message.c_str());
   else fprintf(stderr, "%s%s\n", msgheader, Message.c_str());
}

/*********************************************************************************************************************

-FUNCTION-
AdjustLogLevel: Adjusts the base-line of all log messages.

This function adjusts the detail level of all outgoing log messages.  To illustrate, setting the `Delta` value to 1
would result in level 5 (API) log messages being bumped to level 6.  Adjustments are accumulative and apply to the
calling thread only.  To revert, call this function again with a negation of the previously passed value.

-INPUT-
int Delta: The level of adjustment to make to new log messages.  Zero is no change.  The maximum level is +/- 6.

-RESULT-
int: Returns the absolute base-line value that was active prior to calling this function.

*********************************************************************************************************************/

int AdjustLogLevel(int Delta)
{
   int old_level = tlBaseLine;
   if ((Delta >= -6) and (Delta <= 6)) tlBaseLine += Delta;
   return old_level;
}

//********************************************************************************************************************

void SetLogLevel(int Level)
{
   if (Level < 0) Level = 0;
   else if (Level > 9) Level = 9;
   glLogLevel.store(Level, std::memory_order_relaxed);
}

int GetLogLevel(void)
{
   return glLogLevel.load(std::memory_order_relaxed);
}

/*********************************************************************************************************************

-FUNCTION-
ParseLogLevel: Converts a level name or number to a numeric log level.

Accepted names are `critical`, `error`, `warning`, `info`, `api`, `detail`, `debug` and `trace` (case insensitive).
A numeric string in the range 0 - 9 is also accepted.

-ERRORS-
Okay
NullArgs
InvalidValue: The string does not name a known level.

*********************************************************************************************************************/

ERR ParseLogLevel(CSTRING Value, int &Level)
{
   if (!Value) return ERR::NullArgs;

   if ((Value[0] >= '0') and (Value[0] <= '9') and (!Value[1])) {
      Level = Value[0] - '0';
      return ERR::Okay;
   }

   for (auto &entry : glLevelNames) {
      if (!strcasecmp(entry.Name, Value)) {
         Level = entry.Level;
         return ERR::Okay;
      }
   }
   return ERR::InvalidValue;
}

/*********************************************************************************************************************

-FUNCTION-
VLogF: Sends formatted messages to the standard log.
Status: Internal

This function manages the output of log messages by sending them through the log filter.  If the filter is not
passed, the function does nothing.  Message formatting follows the same guidelines as the `printf()` function.
Clients should use the scope-managed `mx::Log` class rather than calling this function directly.

-INPUT-
int(VLF) Flags: Optional flags
cstr Header: A short name for the first column.  Typically function names are placed here.
cstr Message: A formatted message to print.
va_list Args: A `va_list` corresponding to the arguments referenced in `Message`.

*********************************************************************************************************************/

void VLogF(VLF Flags, CSTRING Header, CSTRING Message, va_list Args)
{
   auto log_setting = glLogLevel.load(std::memory_order_relaxed);

   int level = log_setting - tlBaseLine;
   if (level > 9) level = 9;
   else if (level < 0) level = 0;

   bool should_log = ((LOG_LEVELS[level] & Flags) != VLF::NIL);
   if ((!should_log) and (log_setting > 1) and ((Flags & (VLF::WARNING|VLF::ERROR|VLF::CRITICAL)) != VLF::NIL)) should_log = true;

   if (should_log) {
      bool highlight = ((Flags & (VLF::ERROR|VLF::WARNING|VLF::CRITICAL)) != VLF::NIL);
      auto state = ((Flags & (VLF::BRANCH|VLF::FUNCTION)) != VLF::NIL) ? MS_FUNCTION : MS_MSG;
      print_line(Header, state, highlight, format_message(Message, Args));
   }

   if ((Flags & VLF::BRANCH) != VLF::NIL) tlDepth++;
}

/*********************************************************************************************************************

-FUNCTION-
FuncError: Sends basic error messages to the application log.
Status: Internal

This function outputs the message associated with an error code, e.g. `FuncError("align", ERR::LengthMismatch)`
prints `align: Vertex lists must have the same length.`

-INPUT-
cstr Header: A short string that names the function that is making the call.
error Code: An error code from the `system/errors.h` include file.

-RESULT-
error: Returns the same code that was specified in the `Code` parameter.

*********************************************************************************************************************/

ERR FuncError(CSTRING Header, ERR Code)
{
   if (glLogLevel.load(std::memory_order_relaxed) < 2) return Code;
   if (!Header) Header = "Function";
   print_line(Header, MS_MSG, true, GetErrorMsg(Code));
   return Code;
}

/*********************************************************************************************************************

-FUNCTION-
LogReturn: Revert to the previous branch in the application logging tree.
Status: Internal

Use LogReturn() to reverse any previous log message that created an indented branch.  Clients must use the
scope-managed `mx::Log` class for branched log output.

*********************************************************************************************************************/

void LogReturn(void)
{
   if ((--tlDepth) < 0) tlDepth = 0;
}

//********************************************************************************************************************
// Buffer must be COLUMN1+1 in size

static void fmsg(CSTRING Header, char *Buffer, int8_t Colon)
{
   if (!Header) Header = "";

   int16_t pos = 0;
   int16_t col = COLUMN1;
   auto log_setting = glLogLevel.load(std::memory_order_relaxed);
   int16_t depth = (log_setting < 3) ? 0 : ((tlDepth > col) ? col : tlDepth);

   if (log_setting >= 3) {
      while ((depth > 0) and (pos < col)) {
         Buffer[pos++] = ' ';
         depth--;
      }
   }

   if (pos < col) { // Print as many function letters as possible.
      int16_t len;
      for (len=0; (Header[len]) and (pos < col); len++) Buffer[pos++] = Header[len];
      char last = len ? Header[len-1] : 0;
      if (Colon IS MS_MSG) {
         if ((last != ':') and (last != ')') and (pos < col)) Buffer[pos++] = ':';
      }
      else if (Colon IS MS_FUNCTION) {
         if ((last != ':') and (last != ')') and (pos < col-1)) {
            Buffer[pos++] = '(';
            Buffer[pos++] = ')';
         }
      }

      if (log_setting >= 3) while (pos < col) Buffer[pos++] = ' ';
      else if (pos < col) Buffer[pos++] = ' ';
   }

   Buffer[pos] = 0;
}

} // namespace
