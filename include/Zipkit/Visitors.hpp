// include/Zipkit/Visitors.hpp
#ifndef ZIPKIT_VISITORS_HPP
#define ZIPKIT_VISITORS_HPP

#include <Zipkit/Types/ArchiveEntry.hpp>

namespace Zipkit {

    // Default visitors. With verbose == false they accept every entry silently,
    // otherwise each entry is logged before it is processed. They never abort.
    Visitor makeExtractLogVisitor(bool verbose);
    Visitor makePackLogVisitor(bool verbose);

} // namespace Zipkit

#endif // ZIPKIT_VISITORS_HPP
