#pragma once

#include <cstddef>
#include <ostream>
#include <utility>

namespace ir::debug {

/**
 * @brief Writes a generic-argument list: `<a, b, c>`, or nothing at all when
 * no item was written.
 *
 * Items are callbacks that write themselves to the stream, so a list can mix
 * terms with synthetic fragments such as `Item = T`. Call finish() once the
 * last item is written.
 */
class AngleList {
public:
    explicit AngleList(std::ostream& out) : out_(out) {}

    template<typename WriteItem>
    void item(WriteItem&& write_item) {
        out_ << (count_ == 0 ? "<" : ", ");
        ++count_;
        std::forward<WriteItem>(write_item)();
    }

    void finish() {
        if (count_ > 0) {
            out_ << ">";
        }
    }

    std::size_t size() const { return count_; }

private:
    std::ostream& out_;
    std::size_t count_ = 0;
};

template<typename Iter, typename PrintElem>
void write_angle(std::ostream& out, Iter first, Iter last, PrintElem&& print_elem) {
    AngleList list(out);
    for (; first != last; ++first) {
        const auto& elem = *first;
        list.item([&]() { print_elem(elem); });
    }
    list.finish();
}

} // namespace ir::debug
