#pragma once

// Helpers shared by the loop mapping strategies.

#include <morphic/mapping.h>

namespace mx {

extern VERTICES loop_centroids(const LOOPS &Loops);
extern bool map_degenerate(const LOOPS &Loops1, const LOOPS &Loops2, LOOPS &Matched1, LOOPS &Matched2);
extern void match_equal(const LOOPS &Loops1, const LOOPS &Loops2, LOOPS &Matched1, LOOPS &Matched2);
extern void match_each_destination(const LOOPS &Loops1, const LOOPS &Loops2, LOOPS &Matched1, LOOPS &Matched2);
extern void match_each_source(const LOOPS &Loops1, const LOOPS &Loops2, LOOPS &Matched1, LOOPS &Matched2);

} // namespace
