#include "pc/candidate.hpp"

namespace naivecall {

Candidate::Candidate(std::string _sdp, std::string _mid, int _mline_index) 
    : sdp(std::move(_sdp)),
      mid(std::move(_mid)),
      mline_index(_mline_index) {}

bool Candidate::operator==(const Candidate& other) const {
    return sdp == other.sdp && mid == other.mid && mline_index == other.mline_index;
}

} // namespace naivecall
