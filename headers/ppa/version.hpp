//
// Created by gregorian-rayne on 10/12/26.
//

#ifndef PPA_VERSION_HPP
#define PPA_VERSION_HPP

/**
 * @file version.hpp
 * @brief Python Performance Analyzer version information.
 */

namespace ppa {

    constexpr int VERSION_MAJOR = 0;
    constexpr int VERSION_MINOR = 4;
    constexpr int VERSION_PATCH = 0;

    constexpr auto VERSION_STRING = "0.4.0";

    constexpr auto PROJECT_NAME = "Python Performance Analyzer";

    /**
     * Executable name.
     */
    constexpr auto PROJECT_SHORT_NAME = "ppa";

}  // namespace ppa

#endif //PPA_VERSION_HPP
