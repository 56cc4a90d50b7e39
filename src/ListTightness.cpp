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

#include <algorithm>
#include <iterator>
#include "BlockDispatch.h"

auto mdbt_impl::summarizeItem(const ctx::ItemDraft& item, const BlockSequence& children) noexcept -> ItemGapSummary {
	const bool gapped = children.gapBefore.size() > 1
		and std::find(std::next(children.gapBefore.begin()), children.gapBefore.end(), true) != children.gapBefore.end();
	return { item.separated, gapped };
}

/*
 Loose when a blank line sits between two items or between two blocks
 directly inside one item. Blank lines nested deeper (inside code or a
 sub-list) were already accounted for by the runs that consumed them.
*/
bool mdbt_impl::isTightList(const std::vector<ItemGapSummary>& items) noexcept {
	for (std::size_t i = 0; i < items.size(); ++i) {
		if ((i != 0 and items[i].separated) or items[i].internallyGapped) {
			return false;
		}
	}
	return true;
}
