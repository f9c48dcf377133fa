/**
 * @file itransportadapter.cpp
 * @brief Implementation file for ITransportAdapter interface.
 *
 * Exists so that the build system runs MOC for the interface's signals.
 */

#include "itransportadapter.h"
