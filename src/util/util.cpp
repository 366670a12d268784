/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#include "util.h"

#include <cctype>
#include <iomanip>

namespace blockstatus {

    std::optional<int64_t> parse_byte_size(const string& text) {
        int64_t multiplier = 1;
        string numPart = text;

        if (text.size() >= 2) {
            string suffix = text.substr(text.size() - 2);
            for (auto& c : suffix) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            if (suffix == "KB") {
                multiplier = 1024LL;
                numPart = text.substr(0, text.size() - 2);
            } else if (suffix == "MB") {
                multiplier = 1024LL * 1024;
                numPart = text.substr(0, text.size() - 2);
            } else if (suffix == "GB") {
                multiplier = 1024LL * 1024 * 1024;
                numPart = text.substr(0, text.size() - 2);
            }
        }

        if (numPart.empty()) {
            return std::nullopt;
        }
        for (char c : numPart) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return std::nullopt;
            }
        }

        try {
            unsigned long long value = std::stoull(numPart);
            if (value > static_cast<unsigned long long>(std::numeric_limits<int64_t>::max() / multiplier)) {
                return std::nullopt;
            }
            return static_cast<int64_t>(value) * multiplier;
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    }

    string format_byte_size(int64_t bytes) {
        static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
        double value = static_cast<double>(bytes);
        int unit = 0;
        while ((value >= 1024.0 || value <= -1024.0) && unit < 4) {
            value /= 1024.0;
            unit++;
        }

        ostringstream oss;
        if (unit == 0) {
            oss << bytes << ' ' << units[0];
        } else {
            oss << std::fixed << std::setprecision(1) << value << ' ' << units[unit];
        }
        return oss.str();
    }
}
