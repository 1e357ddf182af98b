#pragma once

/* Strategies for delivering signals to a child and its descendants.
 */

/*   Part of the roomplay package.
 *
 *   Copyright 2026 The roomplay authors
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 *
 */

#include <sys/types.h>
#include <memory>

/**
 * Group_signaller
 *   A child started by Child_mgr may fork helpers of its own (decoders,
 * network threads).  A Group_signaller decides how the child is detached
 * at launch and how a signal reaches the whole tree afterwards.
 *
 * child_setup() runs in the forked child between fork() and exec(), so
 * implementations may only call async-signal-safe functions there.
 */
class Group_signaller {
public:
    virtual ~Group_signaller() {}
    virtual void child_setup() const = 0;
    virtual int signal( pid_t, int ) const = 0;  // 0 or errno
    virtual const char* name() const = 0;
};

using spSignaller = std::shared_ptr<const Group_signaller>;


/// The child becomes leader of a new session and process group;
/// signals go to the whole group with killpg().
///
class Pgroup_signaller : public Group_signaller {
public:
    void child_setup() const override;
    int signal( pid_t, int ) const override;
    const char* name() const override { return "process-group"; }
};


/// For platforms lacking process groups: only the direct child is
/// signalled.
///
class Pid_signaller : public Group_signaller {
public:
    void child_setup() const override {}
    int signal( pid_t, int ) const override;
    const char* name() const override { return "single-pid"; }
};


/// The best strategy available on this platform.
spSignaller default_signaller();
