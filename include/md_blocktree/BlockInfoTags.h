/*
MIT License

Copyright (c) 2020 Christian Greyeyes

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*/

#ifndef MDBLOCKTREE_BLOCK_INFO_TAGS_H
#define MDBLOCKTREE_BLOCK_INFO_TAGS_H
#include <optional>
#include <string>
#include "IntegralTypes.h"

namespace md_blocktree {

	struct ListInfo {
		enum class symbol_e : char {
			dash = '-',
			plus = '+',
			star = '*',
			dot = '.',
			paranth = ')'
		};
		symbol_e symbolUsed;
		bool      isOrdered;
		Int    orderedStart;
		bool        isTight;
	};

	struct HeadingInfo {
		UTinyInt lvl;
		bool isSetext;
	};

	struct FencedCodeInfo {
		enum class symbol_e : char {
			Tilde = '~', BackTick = '`'
		};
		symbol_e                      type;
		UInt                        length;
		std::optional<std::string> infoStr;
	};

}

#endif
