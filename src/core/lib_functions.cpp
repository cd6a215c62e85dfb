/*********************************************************************************************************************

The source code of the Morphic project is made publicly available under the terms described in the LICENSE.TXT file
that is distributed with this package.  Please refer to it for further information on licensing.

*********************************************************************************************************************/

#include "defs.h"

namespace mx {

/*********************************************************************************************************************

-FUNCTION-
GetErrorMsg: Translates error codes into human readable strings.
Category: Logging

The GetErrorMsg() function converts error codes into human readable strings.  If the `Code` is invalid, a string of
"Unknown error code." is returned.

-INPUT-
error Code: The error code to lookup.

-RESULT-
cstr: A human readable string for the error code is returned.

*********************************************************************************************************************/

CSTRING GetErrorMsg(ERR Code)
{
   if ((int(Code) < glTotalMessages) and (int(Code) >= 0)) return glMessages[int(Code)];
   else return glMessages[glTotalMessages];
}

} // namespace
