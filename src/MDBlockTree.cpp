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

#include <fmt/format.h>
#include <plog/Log.h>
#include "md_blocktree/MDBlockTree.h"
#include "BlockDispatch.h"

namespace md = md_blocktree;

md::NestingTooDeep::NestingTooDeep(const UInt ceiling, const UInt depth)
	: std::runtime_error{ fmt::format("container nesting depth {} exceeds the ceiling of {}", depth, ceiling) },
	_ceiling{ ceiling }, _depth{ depth } {}

auto md::parse(std::string_view text, const ParseOptions& options) -> Node {
	const auto lines = mdbt_impl::splitLines(text);
	PLOGD << "parsing " << lines.size() << " lines, nesting ceiling " << options.maxNestingDepth;
	auto blocks = mdbt_impl::dispatchLines(lines, options, 0);
	return Node::document(std::move(blocks.nodes));
}
