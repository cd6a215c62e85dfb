#pragma once

//  errors.h
//
//  Error codes returned by all Morphic functions.  Use GetErrorMsg() to convert a code to a readable message.

#include "types.h"

namespace mx {

enum class ERR : int {
   Okay = 0,
   False,
   NullArgs,
   NoData,
   InvalidValue,
   OutOfRange,
   LengthMismatch,
   VertexCountMismatch,
   MissingDependency,
   Search,
   File,
   AllocMemory,
   Failed,
   END
};

extern CSTRING GetErrorMsg(ERR Code);

} // namespace
