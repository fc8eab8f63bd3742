#ifndef NOVAHTTP_VERSION_H
#define NOVAHTTP_VERSION_H

namespace novahttp
{
    /** Major version, increment for API changes. */
    constexpr int kVersionMajor = 1;

    /** Major version, increment for functionality changes. */
    constexpr int kVersionMinor = 0;

    /** Trivial version, increment for small fixes. */
    constexpr int kVersionTrivial = 0;
}

#endif // NOVAHTTP_VERSION_H
