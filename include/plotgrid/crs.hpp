#pragma once

#include <iostream>
#include <string>

#include "plotgrid/errors.hpp"

namespace plotgrid {

    /**
     * @brief Coordinate reference inputs, carried through unchanged for the writer
     */
    struct CrsInfo {
        std::string utm_zone;          ///< Empty when unknown
        std::string hemisphere = "N";  ///< "N" or "S"
        std::string field;             ///< Trial identifier, e.g. "CS17-G2FE"

        bool defined() const { return !utm_zone.empty(); }
    };

    /**
     * @brief PROJ definition for the UTM zone, NAD83 datum
     *
     * Returns an empty string (and warns) when no zone was given; the writer then emits no
     * projection file.
     */
    inline std::string proj_string(const CrsInfo &crs) {
        if (crs.hemisphere != "N" && crs.hemisphere != "S")
            throw InvalidConfigError("hemisphere must be \"N\" or \"S\", got \"" + crs.hemisphere + "\"");
        if (!crs.defined()) {
            std::cerr << "Warning: coordinate reference system not defined (no UTM zone), "
                      << "output may be hard to load in GIS software" << std::endl;
            return {};
        }
        std::string s = "+proj=utm +zone=" + crs.utm_zone;
        if (crs.hemisphere == "S")
            s += " +south";
        s += " +datum=NAD83 +units=m +no_defs +ellps=GRS80";
        return s;
    }

    /**
     * @brief File stem for one exported collection: [<field>_]<outfile>[_buff]
     */
    inline std::string artifact_name(const std::string &field, const std::string &outfile, bool buffered) {
        std::string name = field.empty() ? outfile : field + "_" + outfile;
        if (buffered)
            name += "_buff";
        return name;
    }

} // namespace plotgrid
