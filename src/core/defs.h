#ifndef DEFS_H
#define DEFS_H 1

#include <atomic>
#include <mutex>
#include <morphic/main.hpp>

namespace mx {

extern CSTRING const glMessages[];
extern const int glTotalMessages;

extern std::atomic<int> glLogLevel;
extern std::mutex glmPrint;
extern thread_local int tlDepth;
extern thread_local int tlBaseLine;

} // namespace

#endif // DEFS_H
