#pragma once

// Standard library stuff
#include <string>
#include <sstream>
#include <vector>
#include <unordered_map>
#include <unordered_set>
#include <algorithm>
#include <functional>
#include <deque>
#include <queue>
#include <map>
#include <set>
#include <cmath>
#include <limits>
#include <cstdarg>
#include <cstdio>
#include <memory>
#include <mutex>
#include <atomic>
#include <thread>

// nocgen stuff
#include "nocgen/nocgen.h"
#include "nocgen/log.h"
#include "util.h"
