#ifndef _PC_CANDIDATE_H_
#define _PC_CANDIDATE_H_

#include "base/defines.hpp"

#include <string>

namespace naivecall {

// An ICE candidate as exchanged over signaling.
struct NAIVECALL_CPP_EXPORT Candidate {
    std::string sdp;
    std::string mid;
    int mline_index = 0;

    Candidate() = default;
    Candidate(std::string sdp, std::string mid, int mline_index = 0);

    bool operator==(const Candidate& other) const;
    bool operator!=(const Candidate& other) const { return !(*this == other); }
};

} // namespace naivecall

#endif
