#include "diktat_debug.h"

Q_LOGGING_CATEGORY(DIKTAT, "diktat", QtInfoMsg)
