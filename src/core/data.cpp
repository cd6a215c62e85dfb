/*********************************************************************************************************************

The source code of the Morphic project is made publicly available under the terms described in the LICENSE.TXT file
that is distributed with this package.  Please refer to it for further information on licensing.

*********************************************************************************************************************/

#include "defs.h"

namespace mx {

// Indexed by ERR.  Keep in sync with system/errors.h

CSTRING const glMessages[] = {
   "Operation successful.",                                     // Okay
   "The result is false.",                                      // False
   "Function call missing required arguments.",                 // NullArgs
   "No data is available for use.",                             // NoData
   "Invalid value detected.",                                   // InvalidValue
   "The value is out of range.",                                // OutOfRange
   "Vertex lists must have the same length.",                   // LengthMismatch
   "Outer vertex counts differ between the interpolated shapes.", // VertexCountMismatch
   "A required optional dependency is not available.",          // MissingDependency
   "A search routine failed to find the requested item.",       // Search
   "File error, e.g. file not found.",                          // File
   "General memory allocation failure.",                        // AllocMemory
   "Operation failed.",                                         // Failed
   "Unknown error code."                                        // END
};

const int glTotalMessages = int(ERR::END);

std::atomic<int> glLogLevel = 2;
std::mutex glmPrint;
thread_local int tlDepth = 0;
thread_local int tlBaseLine = 0;

} // namespace
