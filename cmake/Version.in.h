/* SPDX-License-Identifier: LGPL-3.0-only */
#ifndef PIDSET_VERSION_H
#define PIDSET_VERSION_H

/* NOLINTBEGIN(modernize-macro-to-enum) */
#define PIDSET_VERSION_MAJOR ${VERSION_MAJOR}
#define PIDSET_VERSION_MINOR ${VERSION_MINOR}
#define PIDSET_VERSION_PATCH ${VERSION_PATCH}
#define PIDSET_VERSION_TWEAK ${VERSION_TWEAK}
/* NOLINTEND(modernize-macro-to-enum) */

#endif /* PIDSET_VERSION_H */
