#pragma once

#define VERSION_STR "1.0.0"
