/**
 * @file section.cpp
 * @brief Open section implementation.
 */

#include "progspace/section.hpp"

#include <sstream>
#include <stdexcept>

namespace progspace {

OpenSection::OpenSection(size_t insns_left, std::vector<PlacedInsn> insns)
    : insns_left_(insns_left)
    , insns_(std::move(insns))
{
    if (insns_left_ == 0) {
        throw std::invalid_argument("OpenSection: insns_left must be > 0");
    }
}

void OpenSection::add_insns(const std::vector<PlacedInsn>& insns) {
    if (insns.size() > insns_left_) {
        std::ostringstream oss;
        oss << "OpenSection: cannot add " << insns.size()
            << " instructions, only " << insns_left_ << " left";
        throw std::logic_error(oss.str());
    }
    insns_.insert(insns_.end(), insns.begin(), insns.end());
    insns_left_ -= insns.size();
}

}  // namespace progspace
