#pragma once
#include <cstdint>

using u64  = unsigned long long;
using u128 = unsigned __int128;
using u32  = unsigned int;
