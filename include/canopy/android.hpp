#pragma once

#include "error.hpp"

#include <jni.h>

namespace canopy::android
{
    // Makes the Java virtual machine known to canopy. Only needed when canopy is not loaded through System.loadLibrary,
    // in which case JNI_OnLoad takes care of it. Call it from a Java thread, the glue classes are looked up right away.
    [[nodiscard]] result<> attach(JavaVM *vm);
} // namespace canopy::android
