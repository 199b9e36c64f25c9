#pragma once

// Standard library headers
#include <iostream>
#include <string>
#include <vector>
#include <memory>
#include <unordered_map>
#include <functional>
#include <algorithm>
#include <utility>
#include <atomic>
#include <mutex>
#include <sstream>
#include <fstream>
#include <filesystem>
#include <source_location>
#include <cassert>
#include <cstdint>
#include <cstdlib>

// Third-party headers (stable, never change)
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
