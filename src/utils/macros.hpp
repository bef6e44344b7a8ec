/* SPDX-License-Identifier: MPL-2.0 */

/******************************************************************************/
/*  rconlink Internal Use                                                     */
/******************************************************************************/

#define LIBRCONLINK_UNUSED(object) (void) object

/******************************************************************************/

#if !defined RCONLINK_NON_COPYABLE_NOR_MOVABLE
#define RCONLINK_NON_COPYABLE_NOR_MOVABLE(classname)                           \
  public:                                                                      \
    classname (const classname &) = delete;                                    \
    classname &operator= (const classname &) = delete;                         \
    classname (classname &&) = delete;                                         \
    classname &operator= (classname &&) = delete;
#endif
