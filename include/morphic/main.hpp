#pragma once

// Primary include for the Morphic core.  Brings in the basic types, error codes, logging and configuration.

#include <morphic/system/types.h>
#include <morphic/system/errors.h>
#include <morphic/log.h>
#include <morphic/config.h>
