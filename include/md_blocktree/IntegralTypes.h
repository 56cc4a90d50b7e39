#ifndef MDBLOCKTREE_INTEGRAL_TYPES_H
#define MDBLOCKTREE_INTEGRAL_TYPES_H

#include <cstdint>

namespace md_blocktree {
	using UTinyInt = uint8_t;
	using TinyInt = int8_t;
	using UInt = uint32_t;
	using Int = int32_t;

	// column counts after tab expansion
	using Columns = UInt;
}

#endif
