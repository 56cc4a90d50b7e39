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

#include "md_blocktree/MDBlockTree.h"

using md_blocktree::Node;

/*
 Pre-order advance: descend into the first child when there is one,
 otherwise climb until an ancestor has a next sibling. Climbing past the
 node the walk started at ends the walk.
*/
Node::public_iterator::self_type& Node::public_iterator::operator++() {
	if (_valPtr == nullptr) {
		return *this;
	}
	if (not _valPtr->children().empty()) {
		_parents.emplace_back(_valPtr, 0);
		_valPtr = &_valPtr->children().front();
		return *this;
	}
	while (not _parents.empty()) {
		auto& [parent, index] = _parents.back();
		if (index + 1 < parent->children().size()) {
			++index;
			_valPtr = &parent->children()[index];
			return *this;
		}
		_parents.pop_back();
	}
	_valPtr = nullptr;
	return *this;
}

Node::public_iterator::self_type Node::public_iterator::operator++(int) {
	self_type old = *this;
	++(*this);
	return old;
}
