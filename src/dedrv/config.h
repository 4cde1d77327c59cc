#pragma once

#include "dedrv_config.h"

#define DEDRV_POLICY_ABORT_ALL 0
#define DEDRV_POLICY_CONTINUE 1

#ifndef DEDRV_MAX_DEVICES
#define DEDRV_MAX_DEVICES 32
#endif

#ifndef DEDRV_DEFAULT_FAILURE_POLICY
#define DEDRV_DEFAULT_FAILURE_POLICY DEDRV_POLICY_ABORT_ALL
#endif

#ifndef DEDRV_DEVICE_SECTION_PREFIX
#define DEDRV_DEVICE_SECTION_PREFIX ".dedrv.device."
#endif

#ifndef DEDRV_STRSTREAM_CAPACITY
#define DEDRV_STRSTREAM_CAPACITY 128
#endif

#if DEDRV_MAX_DEVICES <= 0
#error "DEDRV_MAX_DEVICES must be positive"
#endif

#if defined(__AVR__) \
  || defined(__AVR_ATtiny85__) \
  || defined(__AVR_ATmega32U4__) \
  || defined(ARDUINO_TEENSYLC) \
  || defined(__MK20DX128__) \
  || defined(STM32F0) \
  || defined(STM32F1) \
  || defined(ESP8266)
#define DEDRV_HAS_LOTS_OF_MEMORY 0
#else
#define DEDRV_HAS_LOTS_OF_MEMORY 1
#endif
