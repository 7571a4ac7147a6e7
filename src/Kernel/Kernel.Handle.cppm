module;

export module Kernel:Handle;

import Core;

export namespace Kernel
{
    // Reference to one entity of kind T inside a Kernel::Stores instance.
    template <typename T>
    using Handle = Core::StrongHandle<T>;

    template <typename T>
    using Store = Core::Store<T>;
}
